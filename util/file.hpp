#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads the whole file specified by path. If max_size is not zero, at most
  // max_size bytes are read.
  static std::string Read(const std::string& path, size_t max_size = 0);

  // Writes content to the file specified by path, creating the needed
  // folders. The file is first written to a temporary file and then moved in
  // place.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Lists the regular files contained in a directory, sorted by path. Returns
  // an empty list if the directory does not exist or cannot be read.
  static std::vector<std::string> ListFiles(const std::string& path,
                                            bool recursive = false);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Resolves path to an absolute path without symlinks. Throws
  // file_not_found if it does not exist.
  static std::string AbsolutePath(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  static bool IsDirectory(const std::string& path);
};

// Directory that is created by the constructor and recursively removed by the
// destructor, unless Keep() has been called.
class TempDir {
 public:
  explicit TempDir(const std::string& base, const std::string& prefix = "");
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) noexcept;
  TempDir& operator=(TempDir&&) noexcept;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif

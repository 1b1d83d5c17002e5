#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <utility>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/, struct FTW* /*ftwbuf*/) {
                return remove(fpath);
              },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = path + "XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    int error = errno;
    remove(src.c_str());
    return error;
  }
  return remove(src.c_str()) != -1 ? 0 : errno;
}

int OsRead(const std::string& path, size_t max_size, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, util::kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    content->append(buf, amount);
    if (max_size && content->size() >= max_size) {
      content->resize(max_size);
      break;
    }
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.c_str() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) return errno;
  return OsAtomicMove(temp_file, path, overwrite);
}

void OsListFiles(const std::string& path, bool recursive,
                 std::vector<std::string>* files) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return;
  std::vector<std::string> subdirs;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    std::string full = util::File::JoinPath(path, name);
    struct stat info {};
    if (stat(full.c_str(), &info) == -1) continue;
    if (S_ISREG(info.st_mode)) {
      files->push_back(full);
    } else if (recursive && S_ISDIR(info.st_mode)) {
      subdirs.push_back(full);
    }
  }
  closedir(dir);
  for (const std::string& subdir : subdirs) {
    OsListFiles(subdir, recursive, files);
  }
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path, size_t max_size) {
  std::string content;
  int err = OsRead(path, max_size, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    throw file_exists("Write " + path);
  }
  int err = OsWrite(path, content, overwrite);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::vector<std::string> File::ListFiles(const std::string& path,
                                         bool recursive) {
  std::vector<std::string> files;
  OsListFiles(path, recursive, &files);
  std::sort(files.begin(), files.end());
  return files;
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return path.substr(0, 1);
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::AbsolutePath(const std::string& path) {
  char resolved[PATH_MAX] = {};
  if (realpath(path.c_str(), resolved) == nullptr) {
    if (errno == ENOENT) throw file_not_found("realpath " + path);
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  }
  return resolved;
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

bool File::IsDirectory(const std::string& path) {
  struct stat info {};
  if (stat(path.c_str(), &info) == -1) return false;
  return S_ISDIR(info.st_mode);
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  std::string templ = base;
  if (templ.empty() || templ.back() != kPathSeparators[0])
    templ += kPathSeparators[0];
  path_ = OsTempDir(templ + prefix);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}

TempDir::TempDir(TempDir&& other) noexcept
    : path_(std::move(other.path_)), keep_(other.keep_) {
  other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
  std::swap(path_, other.path_);
  std::swap(keep_, other.keep_);
  return *this;
}

void TempDir::Keep() { keep_ = true; }

const std::string& TempDir::Path() const { return path_; }

TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Cannot remove temporary directory " << path_ << ": "
                 << exc.what();
  }
}

}  // namespace util

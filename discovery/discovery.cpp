#include "discovery/discovery.hpp"

#include <cctype>
#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

bool IsWordChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Consumes a non-empty sequence of word characters from the front of text.
bool ConsumeWord(absl::string_view* text, std::string* word) {
  size_t len = 0;
  while (len < text->size() && IsWordChar((*text)[len])) len++;
  if (len == 0) return false;
  *word = std::string(text->substr(0, len));
  text->remove_prefix(len);
  return true;
}

bool ParseHeaderLine(absl::string_view line, std::string* owner,
                     std::string* task) {
  line = absl::StripAsciiWhitespace(line);
  if (!absl::ConsumePrefix(&line, "/*")) return false;
  line = absl::StripLeadingAsciiWhitespace(line);
  if (!absl::ConsumePrefix(&line, "USER:")) return false;
  line = absl::StripLeadingAsciiWhitespace(line);
  if (!ConsumeWord(&line, owner)) return false;
  if (line.empty() || !absl::ascii_isspace(line.front())) return false;
  line = absl::StripLeadingAsciiWhitespace(line);
  if (!absl::ConsumePrefix(&line, "TASK:")) return false;
  line = absl::StripLeadingAsciiWhitespace(line);
  if (!ConsumeWord(&line, task)) return false;
  line = absl::StripLeadingAsciiWhitespace(line);
  return line == "*/";
}

}  // namespace

namespace discovery {

bool ParseHeader(const std::string& content, std::string* owner,
                 std::string* task) {
  int line_number = 0;
  for (absl::string_view line : absl::StrSplit(content, '\n')) {
    if (line_number++ >= kHeaderLines) break;
    if (ParseHeaderLine(line, owner, task)) return true;
  }
  return false;
}

std::vector<proto::Submission> Discover(const std::string& directory,
                                        const std::string& source_suffix,
                                        const std::string& task) {
  if (!util::File::IsDirectory(directory))
    throw util::file_not_found("Submissions directory " + directory);
  std::vector<proto::Submission> submissions;
  for (const std::string& path : util::File::ListFiles(directory, true)) {
    if (!absl::EndsWith(path, source_suffix)) continue;
    std::string content;
    try {
      content = util::File::Read(path);
    } catch (const std::system_error& exc) {
      LOG(WARNING) << "Skipping unreadable file " << path << ": "
                   << exc.what();
      continue;
    }
    std::string owner;
    std::string task_id;
    if (!ParseHeader(content, &owner, &task_id)) {
      LOG(WARNING) << "Skipping file with invalid header: " << path;
      continue;
    }
    if (!task.empty() && task != task_id) {
      VLOG(1) << "Skipping " << path << ": task " << task_id;
      continue;
    }
    VLOG(1) << "Discovered submission: " << owner << " -> " << path;
    proto::Submission submission;
    submission.set_owner(owner);
    submission.set_task_id(task_id);
    submission.set_source_path(path);
    submissions.push_back(std::move(submission));
  }
  LOG(INFO) << "Found " << submissions.size() << " submissions in "
            << directory;
  return submissions;
}

}  // namespace discovery

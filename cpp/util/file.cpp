#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) return "";
  return data.data();
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
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

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::Normalize(const std::string& path) {
  bool absolute = !path.empty() && path[0] == kPathSeparators[0];
  std::vector<std::string> parts;
  std::stringstream ss(path);
  std::string item;
  while (std::getline(ss, item, kPathSeparators[0])) {
    if (item.empty() || item == ".") continue;
    if (item == "..") {
      if (!parts.empty() && parts.back() != "..") {
        parts.pop_back();
      } else if (!absolute) {
        parts.push_back(item);
      }
      continue;
    }
    parts.push_back(item);
  }
  std::string result = absolute ? "/" : "";
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) result += kPathSeparators[0];
    result += parts[i];
  }
  if (result.empty()) return ".";
  return result;
}

bool File::IsInside(const std::string& path, const std::string& root) {
  if (path == root) return true;
  if (root == "/") return !path.empty() && path[0] == '/';
  return path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
         path[root.size()] == kPathSeparators[0];
}

std::string File::RealPath(const std::string& path) {
  char resolved[PATH_MAX] = {};
  if (realpath(path.c_str(), resolved) == nullptr) {
    throw std::system_error(errno, std::system_category(), "realpath " + path);
  }
  return resolved;
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util

#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <kj/common.h>
#include <string>

namespace util {

class File {
 public:
  // Reads the whole content of a file.
  static std::string Read(const std::string& path);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Lexically resolves ".", ".." and repeated separators. Does not touch the
  // filesystem, so symlinks are not followed. A relative path that climbs
  // above its starting point keeps its leading "..".
  static std::string Normalize(const std::string& path);

  // Returns true if path is equal to root or is inside it. Both paths must
  // already be normalized.
  static bool IsInside(const std::string& path, const std::string& root);

  // Resolves symlinks and returns the canonical absolute path. Throws
  // std::system_error if the path does not exist.
  static std::string RealPath(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path exists and is a directory.
  static bool IsDirectory(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif

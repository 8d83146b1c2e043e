/**
 * @file staging.cpp
 * @brief Staging directory implementation
 */

#include "transync/staging.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace transync {

StagingDirectory::StagingDirectory(const fs::path &parent) {
  std::string templ = (parent / "transync-XXXXXX").string();
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');

  if (::mkdtemp(buf.data()) == nullptr)
    throw std::system_error(errno, std::generic_category(),
                            "cannot create staging directory in " +
                                parent.string());
  path_ = fs::path(buf.data());
}

StagingDirectory::~StagingDirectory() { remove(); }

fs::path StagingDirectory::staged_path_for(
    const fs::path &relative, const std::string &target_format) const {
  return path_ / (relative.string() + "." + target_format);
}

bool StagingDirectory::remove() {
  if (removed_)
    return true;
  std::error_code ec;
  fs::remove_all(path_, ec);
  removed_ = !ec && !fs::exists(path_, ec);
  return removed_;
}

} // namespace transync

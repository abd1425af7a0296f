/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>

#include <glog/logging.h>

#include "errors.h"
#include "fs_utils.h"

namespace hostnet {

void ensure_tree(const std::string &path, mode_t mode) {
  if (path.empty())
    return;

  std::string::size_type pos = 0;
  do {
    pos = path.find('/', pos + 1);
    std::string dir = path.substr(0, pos);

    if (::mkdir(dir.c_str(), mode) < 0 && errno != EEXIST)
      throw hostnet_error("failed to create directory " + dir + ": " +
                          strerror(errno));
  } while (pos != std::string::npos);
}

void write_to_file(const std::string &path, const std::string &data) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);

  if (!file.is_open())
    throw hostnet_error("failed to open " + path + " for writing");

  file << data;
  file.close();

  if (file.fail())
    throw hostnet_error("failed to write " + path);

  VLOG(2) << __FUNCTION__ << ": wrote " << data.size() << " bytes to "
          << path;
}

void set_file_mode(const std::string &path, mode_t mode) {
  if (::chmod(path.c_str(), mode) < 0)
    throw hostnet_error("failed to chmod " + path + ": " + strerror(errno));
}

bool file_exists(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

pid_t read_pid_file(const std::string &path) {
  std::ifstream file(path);
  long pid = 0;

  if (!file.is_open())
    return 0;

  if (!(file >> pid) || pid <= 0) {
    LOG(WARNING) << __FUNCTION__ << ": invalid pid file " << path;
    return 0;
  }

  return static_cast<pid_t>(pid);
}

} // namespace hostnet

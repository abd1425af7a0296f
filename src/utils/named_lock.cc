/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "errors.h"
#include "fs_utils.h"
#include "named_lock.h"

DECLARE_string(lock_path);

namespace hostnet {

namespace {

std::mutex registry_mutex;
std::map<std::string, std::unique_ptr<std::mutex>> registry;

std::mutex &get_mutex(const std::string &name) {
  std::lock_guard<std::mutex> lock(registry_mutex);
  auto it = registry.find(name);
  if (it == registry.end())
    it = registry.emplace(name, std::unique_ptr<std::mutex>(new std::mutex()))
             .first;
  return *it->second;
}

} // namespace

std::string named_lock::lock_file_path(const std::string &name) {
  std::string safe(name);
  for (auto &c : safe) {
    if (c == '/' || c == ':')
      c = '-';
  }
  return FLAGS_lock_path + "/hostnet-" + safe + ".lock";
}

named_lock::named_lock(const std::string &name, bool external)
    : name(name), local(get_mutex(name)), fd(-1) {
  VLOG(3) << __FUNCTION__ << ": acquired local lock " << name;

  if (!external)
    return;

  ensure_tree(FLAGS_lock_path);

  std::string path = lock_file_path(name);
  fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0)
    throw hostnet_error("failed to open lock file " + path + ": " +
                        strerror(errno));

  while (::flock(fd, LOCK_EX) < 0) {
    if (errno == EINTR)
      continue;
    int err = errno;
    ::close(fd);
    fd = -1;
    throw hostnet_error("failed to lock " + path + ": " + strerror(err));
  }

  VLOG(3) << __FUNCTION__ << ": acquired external lock " << path;
}

named_lock::~named_lock() {
  if (fd != -1) {
    if (::flock(fd, LOCK_UN) < 0)
      LOG(ERROR) << __FUNCTION__ << ": failed to unlock " << name << ": "
                 << strerror(errno);
    ::close(fd);
  }

  VLOG(3) << __FUNCTION__ << ": released lock " << name;
}

} // namespace hostnet

/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <mutex>
#include <string>

namespace hostnet {

/**
 * @brief scoped lock keyed by a resource name
 *
 * Serializes threads of this process through a mutex per name and, if
 * external, other processes on the host through an advisory lock on
 * <lock_path>/hostnet-<name>.lock.
 */
class named_lock final {
public:
  explicit named_lock(const std::string &name, bool external = true);
  ~named_lock();

  const std::string &get_name() const { return name; }

  static std::string lock_file_path(const std::string &name);

private:
  named_lock(const named_lock &other) = delete; // non construction-copyable
  named_lock &operator=(const named_lock &) = delete; // non copyable

  std::string name;
  std::unique_lock<std::mutex> local;
  int fd;
};

} // namespace hostnet

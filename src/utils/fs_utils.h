/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <sys/types.h>

#include <string>

namespace hostnet {

// mkdir -p
void ensure_tree(const std::string &path, mode_t mode = 0755);

void write_to_file(const std::string &path, const std::string &data);
void set_file_mode(const std::string &path, mode_t mode);

bool file_exists(const std::string &path);

/**
 * @brief read a pid file
 *
 * @return the pid, or 0 if the file is missing or holds no valid pid
 */
pid_t read_pid_file(const std::string &path);

} // namespace hostnet

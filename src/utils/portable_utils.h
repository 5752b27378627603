//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

// Text of the last socket error (errno or WSAGetLastError).
const char *get_error_text();

// WSAStartup on Windows, no-op elsewhere. Throws std::runtime_error on failure.
void network_startup();

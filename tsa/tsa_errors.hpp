/* File: tsa_errors.hpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#pragma once

#include <stdexcept>

namespace pdfseal::tsa {

/// @brief the timestamp was not obtained
class TsaError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// @brief no response within the configured timeout
class TsaTimeoutError : public TsaError {
 public:
  using TsaError::TsaError;
};

}  // namespace pdfseal::tsa

/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/errors.hpp"

namespace fh {

const char* to_string(Errc e) {
    switch (e) {
        case Errc::Ok:                return "ok";
        case Errc::AlreadyRegistered: return "filter already registered";
        case Errc::NotFound:          return "filter not found";
        case Errc::MaxFilters:        return "maximum number of filters registered";
        case Errc::IdGeneration:      return "new filter id: random source failure";
        case Errc::Cancelled:         return "context cancelled";
    }
    return "unknown error";
}

} // namespace fh

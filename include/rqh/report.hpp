// SPDX-License-Identifier: MIT

#pragma once
#include "config.hpp"
#include "hash.hpp"
#include <ostream>
#include <string>

namespace rqh {

// Human-readable summary: parameters, top bitstring, hash hex, top-K list.
void write_text_report(std::ostream& os, const RunConfig& rc, const HashResult& r);

// JSON document with the parameters, final hash, top-K and full counts.
void write_json_report(std::ostream& os, const RunConfig& rc, const HashResult& r);

// JSON string body. Well-formed UTF-8 passes through; any other byte >= 0x80
// becomes \u00XX so the document stays valid.
std::string json_escape(const std::string& s);

} // namespace rqh

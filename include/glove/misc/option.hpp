#pragma once
#include <string>

#include "json11.hpp"

namespace glove {

// Reads a JSON option file into `out`. On failure `err` describes why.
bool read_option_file(const std::string& opt_path, json11::Json& out, std::string& err);

// Overlays `opt` on `defaults`. A key present in both must carry the same
// JSON type as its default unless the default is null.
bool merge_options(const json11::Json& opt,
                   const json11::Json::object& defaults,
                   json11::Json& out,
                   std::string& err);

}

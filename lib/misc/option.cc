#include <fstream>
#include <iterator>

#include "glove/misc/option.hpp"

using namespace std;
using namespace json11;

namespace glove {

static const char* type_name(Json::Type type)
{
    switch (type) {
        case Json::NUL: return "null";
        case Json::NUMBER: return "number";
        case Json::BOOL: return "bool";
        case Json::STRING: return "string";
        case Json::ARRAY: return "array";
        case Json::OBJECT: return "object";
    }
    return "unknown";
}

bool read_option_file(const string& opt_path, Json& out, string& err)
{
    ifstream in(opt_path.c_str());
    if (not in.is_open()) {
        err = "File not exists: " + opt_path;
        return false;
    }

    string str((istreambuf_iterator<char>(in)),
               istreambuf_iterator<char>());
    string parse_err;
    Json j = Json::parse(str, parse_err);
    if (not parse_err.empty()) {
        err = "Failed to parse " + opt_path + ": " + parse_err;
        return false;
    }
    out = j;
    return true;
}

bool merge_options(const Json& opt, const Json::object& defaults, Json& out, string& err)
{
    if (not opt.is_object()) {
        err = string("Options must be a JSON object, got ") + type_name(opt.type());
        return false;
    }

    Json::object merged = defaults;
    for (const auto& kv : opt.object_items()) {
        auto it = defaults.find(kv.first);
        if (it != defaults.end() and not it->second.is_null()
                and it->second.type() != kv.second.type()) {
            err = "Option '" + kv.first + "' expects " + type_name(it->second.type())
                + ", got " + type_name(kv.second.type());
            return false;
        }
        merged[kv.first] = kv.second;
    }
    out = Json(merged);
    return true;
}

}

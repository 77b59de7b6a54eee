// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/istreamwrapper.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <type_traits>

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;

// A namespace to keep our helper functions organized
namespace jhlp {

    // Parses a JSON string into a RapidJSON Document.
    // Returns false and prints the parse error on failure.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error: " << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    // Parses a JSON file into a RapidJSON Document.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            std::cerr << "Failed to open file: " << file_path << std::endl;
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error in file " << file_path << ": "
                      << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    // True when 'key' exists on 'parent' but does not hold a T.
    template<typename T>
    inline bool wrong_type(const rapidjson::Value& parent, const std::string& key) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) return false;
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) return !val.IsString();
        else if constexpr (std::is_same_v<T, bool>)   return !val.IsBool();
        else if constexpr (std::is_same_v<T, uint64_t>) return !val.IsUint64();
        else return true;
    }

    // Template helper to get a value from a RapidJSON Value/Document.
    // Returns default_value if the key is missing or holds another type.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        }
        return default_value;
    }

    inline std::string dump(const rapidjson::Value& value) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
        return buffer.GetString();
    }

} // namespace jhlp

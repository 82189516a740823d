#pragma once 

#include <string>
#include "const/rest_enums.hpp"

namespace dropzone {

class endpoint
{
    RequestKind kind;
    HttpRequest rest_type;
    std::string path;

public:
    endpoint(RequestKind kind, 
             HttpRequest rest_type, 
             const std::string& path)
        : kind(kind), rest_type(rest_type), path(path) {}

    const std::string& get_path() const { return path; }
    RequestKind get_kind() const { return kind; }
    HttpRequest get_rest_type() const { return rest_type; }
};

} // namespace dropzone

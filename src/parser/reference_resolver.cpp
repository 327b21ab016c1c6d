#include "parser/reference_resolver.hpp"

#include "log/log.hpp"

namespace sidl::parser {

auto ForwardReferenceResolver::resolve_bare_identifier(std::string_view name,
                                                       SourceLocation location) -> node::Node {
    if (name == "true") {
        return node::Node(true, location);
    }
    if (name == "false") {
        return node::Node(false, location);
    }
    if (name == "null") {
        return node::Node(location);
    }

    SIDL_LOG_TRACE("parser", "Deferring reference '" << name << "' at " << location.to_string());
    references_.push_back(ForwardReference{.name = std::string(name), .location = location});
    return node::Node(std::string(name), location);
}

} // namespace sidl::parser

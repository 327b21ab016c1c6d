//! # Reference Resolution
//!
//! Bare (unquoted) identifiers used as values, as in `@default(true)` or
//! `@references(resource: City)`, are handed to a `ReferenceResolver`. The
//! parser never decides what a name means on its own.
//!
//! `ForwardReferenceResolver` is the resolver used while loading a document:
//! it turns keyword literals into their values and keeps every other name as
//! a string, recording it so a later pass with the complete namespace table
//! can check or rewrite it.

#ifndef SIDL_PARSER_REFERENCE_RESOLVER_HPP
#define SIDL_PARSER_REFERENCE_RESOLVER_HPP

#include "common.hpp"
#include "node/node.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sidl::parser {

/// Turns a bare identifier value into a node.
class ReferenceResolver {
public:
    virtual ~ReferenceResolver() = default;

    [[nodiscard]] virtual auto resolve_bare_identifier(std::string_view name,
                                                       SourceLocation location) -> node::Node = 0;
};

/// A name that still has to be resolved once every shape is known.
struct ForwardReference {
    std::string name;
    SourceLocation location;
};

/// Resolves `true`, `false` and `null`; defers everything else.
class ForwardReferenceResolver : public ReferenceResolver {
public:
    [[nodiscard]] auto resolve_bare_identifier(std::string_view name, SourceLocation location)
        -> node::Node override;

    /// Deferred names in the order they were encountered.
    [[nodiscard]] auto references() const -> const std::vector<ForwardReference>& {
        return references_;
    }

private:
    std::vector<ForwardReference> references_;
};

} // namespace sidl::parser

#endif // SIDL_PARSER_REFERENCE_RESOLVER_HPP

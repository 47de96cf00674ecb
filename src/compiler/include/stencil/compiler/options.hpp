#pragma once

#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"

namespace stencil::compiler {

// ============================================================================
// Compiler configuration
// ============================================================================

struct CompilerOptions {
    // Name used in diagnostics (file path, or <stdin>)
    String source_name{"<input>"};
    // Pass markup comments through to the output
    bool keep_comments{false};
    // Drop xmlns declarations that bind a registered vocabulary
    bool strip_vocabulary_declarations{true};
    // Re-escape &, < and > in passed-through text
    bool escape_text{true};
    // Namespace URIs with this prefix are reserved for vocabularies
    String vocabulary_uri_scheme{"stencil:"};
};

} // namespace stencil::compiler

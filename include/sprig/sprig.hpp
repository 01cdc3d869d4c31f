#pragma once

/// Convenience umbrella header for the sprig library.

#include <sprig/lexer/lexer.hpp>
#include <sprig/lexer/token.hpp>
#include <sprig/repl/repl.hpp>

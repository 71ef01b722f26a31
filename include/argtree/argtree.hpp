#ifndef ARGTREE_ARGTREE_HPP
#define ARGTREE_ARGTREE_HPP

#include "arity.hpp"
#include "codec.hpp"
#include "command.hpp"
#include "context.hpp"
#include "error.hpp"
#include "exit_code.hpp"
#include "help.hpp"
#include "json.hpp"
#include "parameter.hpp"
#include "parser.hpp"
#include "utils.hpp"

#endif // ARGTREE_ARGTREE_HPP

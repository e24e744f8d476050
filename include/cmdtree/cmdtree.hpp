#ifndef CMDTREE_CMDTREE_HPP
#define CMDTREE_CMDTREE_HPP

#include "color.hpp"
#include "completion.hpp"
#include "context.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "grammar.hpp"
#include "help.hpp"
#include "node.hpp"
#include "parser.hpp"
#include "schema.hpp"
#include "utils.hpp"
#include "value.hpp"

#endif // CMDTREE_CMDTREE_HPP

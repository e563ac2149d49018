#ifndef TOKENBORROW_HPP
#define TOKENBORROW_HPP

// tokenborrow - a token/permission model of a dynamic aliasing discipline
//
// One memory location, one tree of references derived from a root. Token
// units flow along the derivation edges and the permission register decides
// which reference kinds may read or write:
// - Unique references write only while holding the sole unit
// - SharedReadWrite references write whenever the token is read-write
// - SharedReadOnly references never write, and read only when no writer
//   can be active

#include "tokenborrow/result.hpp"
#include "tokenborrow/option.hpp"
#include "tokenborrow/violation.hpp"
#include "tokenborrow/verify.hpp"
#include "tokenborrow/reference.hpp"
#include "tokenborrow/registry.hpp"
#include "tokenborrow/permission.hpp"
#include "tokenborrow/access.hpp"
#include "tokenborrow/machine.hpp"

#endif // TOKENBORROW_HPP

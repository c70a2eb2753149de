#pragma once

#include "util/Exception.hpp"

namespace core {

/*
 * Thrown when a move is requested that is not legal in the given state, including any move on a
 * finished state. This is a consequence of caller input rather than a bug, so it is a
 * util::CleanException: a program's main() can report it and exit without a core dump.
 */
class IllegalMoveError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

/*
 * Thrown on a structural contract violation: querying the winner of an unfinished game, expanding
 * an already-expanded node, merging nodes whose keys differ, configuring a forward sweep with a
 * non-positive depth, etc. These indicate a programming error and are not meant to be recovered
 * from.
 */
class InvalidStateError : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace core

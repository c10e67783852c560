#pragma once

#include <stdexcept>
#include <string>

#include "position.hpp"

namespace gambit::model {

// Thrown for structurally invalid position strings
class FenError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

namespace fen {

// Throws FenError if `fen` is not well formed (see validationError()) or the side
// not to move is in check.
Position parse(const std::string& fen);
std::string serialize(const Position& pos);

}  // namespace fen
}  // namespace gambit::model

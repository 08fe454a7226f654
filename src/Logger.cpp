#include "instrument-sim/Logger.hpp"

namespace instsim {

// DLL-safe singleton implementation
InstrumentLogger &InstrumentLogger::instance() {
  static InstrumentLogger logger;
  return logger;
}

} // namespace instsim

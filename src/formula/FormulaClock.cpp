#include "formula/FormulaClock.h"

const FormulaClock &FormulaClock::system() {
  static const SystemClock clock;
  return clock;
}

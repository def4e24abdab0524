#include "formula/FormulaOptions.h"
#include "utils/ConfigLoader.h"
#include <QDebug>

FormulaOptions FormulaOptions::fromConfig(const ConfigLoader &config) {
  FormulaOptions options;
  if (!config.hasSection("FORMULA")) {
    qDebug() << "[FormulaOptions] No [FORMULA] section, using defaults";
    return options;
  }

  options.debug = config.getBool("FORMULA", "debug", options.debug);
  options.maxDepth = config.getInt("FORMULA", "max_depth", options.maxDepth);
  options.sampleSize =
      config.getInt("FORMULA", "sample_size", options.sampleSize);
  options.parallelThreshold =
      config.getInt("FORMULA", "parallel_threshold", options.parallelThreshold);

  if (options.maxDepth < 1)
    options.maxDepth = 1;
  if (options.sampleSize < 1)
    options.sampleSize = 1;
  if (options.parallelThreshold < 0)
    options.parallelThreshold = 0;
  return options;
}

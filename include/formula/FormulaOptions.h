#ifndef FORMULA_OPTIONS_H
#define FORMULA_OPTIONS_H

class ConfigLoader;
class FormulaClock;

/**
 * @brief Engine-wide settings threaded into every FormulaEngine entry point
 *
 * INI keys (section [FORMULA]):
 *   debug              = false   log compile / evaluation failures via qDebug
 *   max_depth          = 200     nesting limit for parsing and evaluation
 *   sample_size        = 10      rows sampled by inferType()
 *   parallel_threshold = 0       computeColumn() goes parallel at this many
 *                                rows (0 = always sequential)
 */
struct FormulaOptions {
    bool debug = false;
    int  maxDepth = 200;
    int  sampleSize = 10;
    int  parallelThreshold = 0;

    // Not owned. nullptr → FormulaClock::system()
    const FormulaClock *clock = nullptr;

    static FormulaOptions fromConfig(const ConfigLoader &config);
};

#endif // FORMULA_OPTIONS_H

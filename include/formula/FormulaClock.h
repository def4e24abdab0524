#ifndef FORMULA_CLOCK_H
#define FORMULA_CLOCK_H

#include <QDateTime>

// ═══════════════════════════════════════════════════════════════════
// FORMULA CLOCK: time source for TODAY() / NOW()
// ═══════════════════════════════════════════════════════════════════

class FormulaClock {
public:
    virtual ~FormulaClock() = default;

    // Current instant, in UTC
    virtual QDateTime now() const = 0;

    // Process-wide wall clock, used when no clock is configured
    static const FormulaClock &system();
};

class SystemClock : public FormulaClock {
public:
    QDateTime now() const override { return QDateTime::currentDateTimeUtc(); }
};

// Deterministic clock for tests and reproducible batch runs
class FixedClock : public FormulaClock {
public:
    explicit FixedClock(const QDateTime &instant) : m_instant(instant.toUTC()) {}

    void setNow(const QDateTime &instant) { m_instant = instant.toUTC(); }
    QDateTime now() const override { return m_instant; }

private:
    QDateTime m_instant;
};

#endif // FORMULA_CLOCK_H

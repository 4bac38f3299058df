// ==============================================================================
// Layer 1: DSP Primitive - Wave Digital Filter Elements
// ==============================================================================
// Building blocks for wave digital filter circuits: one-port leaves, two-input
// series/parallel adaptors and unadapted root elements.
//
// Trees are composed at compile time by value:
//   WdfParallel<T, WdfResistiveVoltageSource<T>, WdfCapacitor<T>>
// Each adaptor owns its children. Port impedances are recomputed from the
// children on every scan, so changing a component value (capacitance,
// resistance) takes effect on the next sample without any re-adaptation step.
//
// Wave convention (voltage waves, port resistance R):
//   v = (a + b) / 2,  i = (a - b) / (2R)
//   a: incident wave (into the element), b: reflected wave (out of it)
//
// Per sample (see WdfCircuit):
//   1. root.setPortResistance(tree.impedance())
//   2. root.incident(tree.reflected())      forward scan, leaves -> root
//   3. tree.incident(root.reflected())      backward scan, root -> leaves
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations)
// - Layer 1 (depends on Layer 0, implicit_solver.h and diode_clipper.h)
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/primitives/diode_clipper.h>
#include <volta/dsp/primitives/implicit_solver.h>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <utility>

namespace Volta {
namespace DSP {

// =============================================================================
// Wave
// =============================================================================

/// @brief Incident/reflected wave pair at one port.
template<SampleType T>
struct WdfWave {
    T a = T(0);  ///< Incident
    T b = T(0);  ///< Reflected

    [[nodiscard]] T voltage() const noexcept { return (a + b) * T(0.5); }

    [[nodiscard]] T current(T portResistance) const noexcept {
        return (a - b) / (T(2) * portResistance);
    }
};

// =============================================================================
// Concepts
// =============================================================================

/// @brief An adapted one-port: its reflected wave never depends on the
/// incident wave of the same sample, so it can sit anywhere below the root.
template<typename E>
concept WdfElement = requires(E e, const E ce, typename E::Sample x, double sampleRate) {
    requires SampleType<typename E::Sample>;
    { ce.impedance() } noexcept -> std::convertible_to<typename E::Sample>;
    { e.reflected() } noexcept -> std::convertible_to<typename E::Sample>;
    { e.incident(x) } noexcept;
    { ce.wave() } noexcept -> std::same_as<WdfWave<typename E::Sample>>;
    { e.prepare(sampleRate) } noexcept;
    { e.reset() } noexcept;
};

/// @brief An unadapted element that can only terminate a tree.
template<typename R>
concept WdfRoot = requires(R r, const R cr, typename R::Sample x) {
    requires SampleType<typename R::Sample>;
    { r.setPortResistance(x) } noexcept;
    { r.incident(x) } noexcept;
    { r.reflected() } noexcept -> std::convertible_to<typename R::Sample>;
    { cr.wave() } noexcept -> std::same_as<WdfWave<typename R::Sample>>;
    { r.reset() } noexcept;
};

/// Voltage across any element exposing wave()
template<typename E>
[[nodiscard]] inline auto wdfVoltage(const E& element) noexcept {
    return element.wave().voltage();
}

/// Current through an adapted element (into the port)
template<WdfElement E>
[[nodiscard]] inline auto wdfCurrent(const E& element) noexcept {
    return element.wave().current(element.impedance());
}

// =============================================================================
// Leaves
// =============================================================================

/// @brief Resistor: b = 0.
template<SampleType T>
class WdfResistor {
public:
    using Sample = T;

    explicit WdfResistor(T resistance = T(1000)) noexcept { setResistance(resistance); }

    void setResistance(T resistance) noexcept {
        resistance_ = std::max(resistance, kMinResistance);
    }
    [[nodiscard]] T getResistance() const noexcept { return resistance_; }

    [[nodiscard]] T impedance() const noexcept { return resistance_; }
    [[nodiscard]] T reflected() noexcept { wave_.b = T(0); return wave_.b; }
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void prepare(double) noexcept {}
    void reset() noexcept { wave_ = {}; }

    static constexpr T kMinResistance = static_cast<T>(1e-6);

private:
    T resistance_ = T(1000);
    WdfWave<T> wave_{};
};

/// @brief Capacitor (bilinear): R = 1 / (2 C fs), b = previous a.
template<SampleType T>
class WdfCapacitor {
public:
    using Sample = T;

    explicit WdfCapacitor(T capacitance = static_cast<T>(1e-6)) noexcept {
        setCapacitance(capacitance);
    }

    void setCapacitance(T capacitance) noexcept {
        capacitance_ = std::max(capacitance, static_cast<T>(1e-15));
    }
    [[nodiscard]] T getCapacitance() const noexcept { return capacitance_; }

    [[nodiscard]] T impedance() const noexcept {
        return T(1) / (T(2) * capacitance_ * sampleRate_);
    }
    [[nodiscard]] T reflected() noexcept { wave_.b = wave_.a; return wave_.b; }
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void prepare(double sampleRate) noexcept {
        if (sampleRate > 0.0) sampleRate_ = static_cast<T>(sampleRate);
    }
    void reset() noexcept { wave_ = {}; }

private:
    T capacitance_ = static_cast<T>(1e-6);
    T sampleRate_ = T(44100);
    WdfWave<T> wave_{};
};

/// @brief Inductor (bilinear): R = 2 L fs, b = -previous a.
template<SampleType T>
class WdfInductor {
public:
    using Sample = T;

    explicit WdfInductor(T inductance = static_cast<T>(1e-3)) noexcept {
        setInductance(inductance);
    }

    void setInductance(T inductance) noexcept {
        inductance_ = std::max(inductance, static_cast<T>(1e-12));
    }
    [[nodiscard]] T getInductance() const noexcept { return inductance_; }

    [[nodiscard]] T impedance() const noexcept { return T(2) * inductance_ * sampleRate_; }
    [[nodiscard]] T reflected() noexcept { wave_.b = -wave_.a; return wave_.b; }
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void prepare(double sampleRate) noexcept {
        if (sampleRate > 0.0) sampleRate_ = static_cast<T>(sampleRate);
    }
    void reset() noexcept { wave_ = {}; }

private:
    T inductance_ = static_cast<T>(1e-3);
    T sampleRate_ = T(44100);
    WdfWave<T> wave_{};
};

/// @brief Voltage source with series resistance: b = Vs.
template<SampleType T>
class WdfResistiveVoltageSource {
public:
    using Sample = T;

    explicit WdfResistiveVoltageSource(T resistance = T(1), T voltage = T(0)) noexcept
        : voltage_(voltage) {
        setResistance(resistance);
    }

    void setVoltage(T voltage) noexcept { voltage_ = voltage; }
    [[nodiscard]] T getVoltage() const noexcept { return voltage_; }
    void setResistance(T resistance) noexcept {
        resistance_ = std::max(resistance, WdfResistor<T>::kMinResistance);
    }
    [[nodiscard]] T getResistance() const noexcept { return resistance_; }

    [[nodiscard]] T impedance() const noexcept { return resistance_; }
    [[nodiscard]] T reflected() noexcept { wave_.b = voltage_; return wave_.b; }
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void prepare(double) noexcept {}
    void reset() noexcept { wave_ = {}; }

private:
    T resistance_ = T(1);
    T voltage_ = T(0);
    WdfWave<T> wave_{};
};

/// @brief Current source with parallel resistance: b = 2 R J.
template<SampleType T>
class WdfResistiveCurrentSource {
public:
    using Sample = T;

    explicit WdfResistiveCurrentSource(T resistance = T(1), T current = T(0)) noexcept
        : current_(current) {
        setResistance(resistance);
    }

    void setCurrent(T current) noexcept { current_ = current; }
    [[nodiscard]] T getCurrent() const noexcept { return current_; }
    void setResistance(T resistance) noexcept {
        resistance_ = std::max(resistance, WdfResistor<T>::kMinResistance);
    }

    [[nodiscard]] T impedance() const noexcept { return resistance_; }
    [[nodiscard]] T reflected() noexcept {
        wave_.b = T(2) * resistance_ * current_;
        return wave_.b;
    }
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void prepare(double) noexcept {}
    void reset() noexcept { wave_ = {}; }

private:
    T resistance_ = T(1);
    T current_ = T(0);
    WdfWave<T> wave_{};
};

// =============================================================================
// Adaptors
// =============================================================================

/// @brief Series connection of two adapted subtrees: R = Rl + Rr.
template<SampleType T, WdfElement Left, WdfElement Right>
class WdfSeries {
public:
    using Sample = T;

    WdfSeries() = default;
    WdfSeries(Left left, Right right) noexcept
        : left_(std::move(left))
        , right_(std::move(right)) {}

    [[nodiscard]] Left& left() noexcept { return left_; }
    [[nodiscard]] Right& right() noexcept { return right_; }
    [[nodiscard]] const Left& left() const noexcept { return left_; }
    [[nodiscard]] const Right& right() const noexcept { return right_; }

    [[nodiscard]] T impedance() const noexcept {
        return static_cast<T>(left_.impedance()) + static_cast<T>(right_.impedance());
    }

    [[nodiscard]] T reflected() noexcept {
        wave_.b = -(static_cast<T>(left_.reflected()) + static_cast<T>(right_.reflected()));
        return wave_.b;
    }

    void incident(T a) noexcept {
        const T ratio = static_cast<T>(left_.impedance()) / impedance();
        const T bl = left_.wave().b;
        const T br = right_.wave().b;
        const T al = bl - ratio * (a + bl + br);
        left_.incident(al);
        right_.incident(-a - al);
        wave_.a = a;
    }

    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }

    void prepare(double sampleRate) noexcept {
        left_.prepare(sampleRate);
        right_.prepare(sampleRate);
    }

    void reset() noexcept {
        left_.reset();
        right_.reset();
        wave_ = {};
    }

private:
    Left left_{};
    Right right_{};
    WdfWave<T> wave_{};
};

/// @brief Parallel connection of two adapted subtrees: G = Gl + Gr.
template<SampleType T, WdfElement Left, WdfElement Right>
class WdfParallel {
public:
    using Sample = T;

    WdfParallel() = default;
    WdfParallel(Left left, Right right) noexcept
        : left_(std::move(left))
        , right_(std::move(right)) {}

    [[nodiscard]] Left& left() noexcept { return left_; }
    [[nodiscard]] Right& right() noexcept { return right_; }
    [[nodiscard]] const Left& left() const noexcept { return left_; }
    [[nodiscard]] const Right& right() const noexcept { return right_; }

    [[nodiscard]] T impedance() const noexcept {
        const T gl = T(1) / static_cast<T>(left_.impedance());
        const T gr = T(1) / static_cast<T>(right_.impedance());
        return T(1) / (gl + gr);
    }

    [[nodiscard]] T reflected() noexcept {
        const T gl = T(1) / static_cast<T>(left_.impedance());
        const T gr = T(1) / static_cast<T>(right_.impedance());
        const T bl = left_.reflected();
        const T br = right_.reflected();
        bDiff_ = br - bl;
        bTemp_ = -(gl / (gl + gr)) * bDiff_;
        wave_.b = br + bTemp_;
        return wave_.b;
    }

    void incident(T a) noexcept {
        const T ar = a + bTemp_;
        left_.incident(bDiff_ + ar);
        right_.incident(ar);
        wave_.a = a;
    }

    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }

    void prepare(double sampleRate) noexcept {
        left_.prepare(sampleRate);
        right_.prepare(sampleRate);
    }

    void reset() noexcept {
        left_.reset();
        right_.reset();
        wave_ = {};
        bDiff_ = T(0);
        bTemp_ = T(0);
    }

private:
    Left left_{};
    Right right_{};
    WdfWave<T> wave_{};
    T bDiff_ = T(0);
    T bTemp_ = T(0);
};

/// @brief Polarity inverter: same impedance, negated waves.
template<SampleType T, WdfElement Inner>
class WdfInverter {
public:
    using Sample = T;

    WdfInverter() = default;
    explicit WdfInverter(Inner inner) noexcept : inner_(std::move(inner)) {}

    [[nodiscard]] Inner& inner() noexcept { return inner_; }
    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }

    [[nodiscard]] T impedance() const noexcept { return inner_.impedance(); }
    [[nodiscard]] T reflected() noexcept { wave_.b = -static_cast<T>(inner_.reflected()); return wave_.b; }
    void incident(T a) noexcept {
        inner_.incident(-a);
        wave_.a = a;
    }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void prepare(double sampleRate) noexcept { inner_.prepare(sampleRate); }
    void reset() noexcept {
        inner_.reset();
        wave_ = {};
    }

private:
    Inner inner_{};
    WdfWave<T> wave_{};
};

// =============================================================================
// Roots
// =============================================================================

/// @brief Ideal voltage source: b = 2 Vs - a.
template<SampleType T>
class WdfIdealVoltageSource {
public:
    using Sample = T;

    explicit WdfIdealVoltageSource(T voltage = T(0)) noexcept : voltage_(voltage) {}

    void setVoltage(T voltage) noexcept { voltage_ = voltage; }
    [[nodiscard]] T getVoltage() const noexcept { return voltage_; }

    void setPortResistance(T) noexcept {}
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] T reflected() noexcept {
        wave_.b = T(2) * voltage_ - wave_.a;
        return wave_.b;
    }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void reset() noexcept { wave_ = {}; }

private:
    T voltage_ = T(0);
    WdfWave<T> wave_{};
};

/// @brief Ideal current source: b = 2 R J + a.
template<SampleType T>
class WdfIdealCurrentSource {
public:
    using Sample = T;

    explicit WdfIdealCurrentSource(T current = T(0)) noexcept : current_(current) {}

    void setCurrent(T current) noexcept { current_ = current; }

    void setPortResistance(T resistance) noexcept { portResistance_ = resistance; }
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] T reflected() noexcept {
        wave_.b = T(2) * portResistance_ * current_ + wave_.a;
        return wave_.b;
    }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void reset() noexcept { wave_ = {}; }

private:
    T current_ = T(0);
    T portResistance_ = T(1);
    WdfWave<T> wave_{};
};

/// @brief Open circuit: b = a.
template<SampleType T>
class WdfOpenCircuit {
public:
    using Sample = T;

    void setPortResistance(T) noexcept {}
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] T reflected() noexcept { wave_.b = wave_.a; return wave_.b; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void reset() noexcept { wave_ = {}; }

private:
    WdfWave<T> wave_{};
};

/// @brief Short circuit: b = -a.
template<SampleType T>
class WdfShortCircuit {
public:
    using Sample = T;

    void setPortResistance(T) noexcept {}
    void incident(T a) noexcept { wave_.a = a; }
    [[nodiscard]] T reflected() noexcept { wave_.b = -wave_.a; return wave_.b; }
    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }
    void reset() noexcept { wave_ = {}; }

private:
    WdfWave<T> wave_{};
};

// =============================================================================
// Diode Pair Root
// =============================================================================

/// @brief Antiparallel diode pair terminating a WDF tree.
///
/// With port resistance R and incident wave a, the port voltage v solves
///   r(v) = R * i_d(v) + v - a = 0
/// where i_d is the Shockley current of the pair. Then b = 2v - a.
/// Solved per sample with Newton-Raphson through ImplicitSolver.
template<SampleType T>
class WdfDiodePair {
public:
    using Sample = T;

    WdfDiodePair() noexcept {
        solver_.setMaxIterations(32);
    }

    explicit WdfDiodePair(const DiodeModel<T>& model) noexcept {
        solver_.setMaxIterations(32);
        setModel(model);
    }

    void setModel(const DiodeModel<T>& model) noexcept {
        model_ = model;
        model_.numForward = std::max(model_.numForward, T(1));
        model_.numBackward = std::max(model_.numBackward, T(1));
    }
    [[nodiscard]] const DiodeModel<T>& getModel() const noexcept { return model_; }

    void setSolverSettings(const SolverSettings<T>& settings) noexcept { solver_.setSettings(settings); }
    [[nodiscard]] const SolverSettings<T>& getSolverSettings() const noexcept { return solver_.getSettings(); }

    void setPortResistance(T resistance) noexcept { portResistance_ = resistance; }
    void incident(T a) noexcept { wave_.a = a; }

    [[nodiscard]] T reflected() noexcept {
        const PortEquation eq{&model_, portResistance_, wave_.a};
        const T guess = detail::diodeInitialGuess(model_, wave_.a, portResistance_);
        lastSolve_ = solver_.solve(eq, guess);
        wave_.b = T(2) * lastSolve_.value - wave_.a;
        return wave_.b;
    }

    [[nodiscard]] WdfWave<T> wave() const noexcept { return wave_; }

    /// Result of the most recent per-sample solve
    [[nodiscard]] const SolverResult<T>& getLastSolve() const noexcept { return lastSolve_; }

    void reset() noexcept {
        wave_ = {};
        lastSolve_ = {};
    }

private:
    struct PortEquation {
        const DiodeModel<T>* model;
        T resistance;
        T incident;

        [[nodiscard]] T residual(T v) const noexcept {
            return resistance * detail::diodePairCurrent(*model, v) + v - incident;
        }
        [[nodiscard]] T derivative(T v) const noexcept {
            return resistance * detail::diodePairConductance(*model, v) + T(1);
        }
    };

    DiodeModel<T> model_{};
    ImplicitSolver<T> solver_{};
    SolverResult<T> lastSolve_{};
    T portResistance_ = T(1);
    WdfWave<T> wave_{};
};

// =============================================================================
// WdfCircuit
// =============================================================================

/// @brief A root element plus the adapted tree hanging below it.
///
/// step() performs one complete scan; sources and component values are set on
/// the tree's elements (via tree()) between steps.
template<SampleType T, WdfRoot Root, WdfElement Tree>
class WdfCircuit {
public:
    using Sample = T;

    WdfCircuit() = default;
    WdfCircuit(Root root, Tree tree) noexcept
        : root_(std::move(root))
        , tree_(std::move(tree)) {}

    void prepare(double sampleRate) noexcept { tree_.prepare(sampleRate); }

    void step() noexcept {
        root_.setPortResistance(static_cast<T>(tree_.impedance()));
        root_.incident(static_cast<T>(tree_.reflected()));
        tree_.incident(static_cast<T>(root_.reflected()));
    }

    void reset() noexcept {
        root_.reset();
        tree_.reset();
    }

    [[nodiscard]] Root& root() noexcept { return root_; }
    [[nodiscard]] Tree& tree() noexcept { return tree_; }
    [[nodiscard]] const Root& root() const noexcept { return root_; }
    [[nodiscard]] const Tree& tree() const noexcept { return tree_; }

    /// Voltage across the root port
    [[nodiscard]] T rootVoltage() const noexcept { return root_.wave().voltage(); }

private:
    Root root_{};
    Tree tree_{};
};

} // namespace DSP
} // namespace Volta

// ==============================================================================
// Volta DSP Lint Stub - every public header in one translation unit
// ==============================================================================
// Gives static analysis and the compiler a .cpp that includes each public
// header, so a header that is not self-contained fails here first. Compiled
// as the OBJECT library volta_dsp_lint; it is not part of the library.
//
// The pffft-backed headers (primitives/fft.h, systems/response_analyzer.h)
// are compiled by the volta_analysis tests instead.
// ==============================================================================

// Layer 0: Core
#include <volta/dsp/core/db_utils.h>
#include <volta/dsp/core/debug_log.h>
#include <volta/dsp/core/math_constants.h>
#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/core/setup_error.h>

// Layer 1: Primitives
#include <volta/dsp/primitives/adaa.h>
#include <volta/dsp/primitives/diode_clipper.h>
#include <volta/dsp/primitives/dynamic_saturator.h>
#include <volta/dsp/primitives/halfband_filter.h>
#include <volta/dsp/primitives/implicit_solver.h>
#include <volta/dsp/primitives/oversampler.h>
#include <volta/dsp/primitives/sample_delay.h>
#include <volta/dsp/primitives/saturators.h>
#include <volta/dsp/primitives/slew_limiter.h>
#include <volta/dsp/primitives/smoother.h>
#include <volta/dsp/primitives/wdf.h>

// Layer 2: Processors
#include <volta/dsp/processors/ladder_filter.h>
#include <volta/dsp/processors/nonlinear_biquad.h>
#include <volta/dsp/processors/saturated_ladder.h>
#include <volta/dsp/processors/state_space.h>
#include <volta/dsp/processors/svf.h>
#include <volta/dsp/processors/waveshaper.h>
#include <volta/dsp/processors/wdf_circuits.h>

// Layer 3: Systems
#include <volta/dsp/systems/combinators.h>
#include <volta/dsp/systems/oversampled.h>
#include <volta/dsp/systems/parameter_exchange.h>

// Explicit instantiations for both sample types
namespace Volta {
namespace DSP {

template class Oversampler<float>;
template class Oversampler<double>;
template class SVF<float>;
template class SVF<double>;
template class LadderFilter<float>;
template class LadderFilter<double>;
template class SaturatedLadder<float>;
template class SaturatedLadder<double, CommonCollector<double>>;
template class NonlinearBiquad<float>;
template class NonlinearBiquad<double>;
template class DcBlocker<float>;
template class Waveshaper<float>;
template class Waveshaper<double, HardClip<double>>;
template class SecondOrderADAA<double, Asinh<double>>;
template class SecondOrderADAA<float, Driven<float, HardClip<float>>>;
template class SlewLimiter<float>;
template class SlewLimiter<double>;
template class DynamicSaturator<float>;
template class WdfRcLowpass<double>;
template class WdfDiodeClipper<float>;
template class WdfDiodeClipper<double>;

static_assert(Processor<Oversampled<SVF<float>>>);
static_assert(HasFrequencyResponse<Series<Waveshaper<float>, LadderFilter<float>>>);
static_assert(HasFrequencyResponse<Parallel<SVF<double>, SampleDelay<double>>>);
static_assert(HasFrequencyResponse<Feedback<NonlinearBiquad<double>>>);
static_assert(Parameterized<LadderFilter<float>>);
static_assert(Parameterized<SaturatedLadder<float>>);
static_assert(HasFrequencyResponse<Series<SlewLimiter<float>, SaturatedLadder<float>>>);
static_assert(DifferentiableSaturator<DynamicSaturator<double>, double>);

} // namespace DSP
} // namespace Volta

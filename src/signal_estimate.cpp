#include "signal_estimate.h"

#include <cmath>

namespace {

struct SignalBucket {
  int lowerRaw;
  int upperRaw;
  double baseDbm;
};

// Strong, good, fair, weak. Each bucket falls 0.5 dB per raw step below its
// upper edge.
constexpr SignalBucket kSignalBuckets[] = {
    {80, 100, -40.0},
    {60, 80, -50.0},
    {20, 60, -60.0},
};
constexpr SignalBucket kWeakBucket = {0, 20, -80.0};
constexpr double kSignalSlopeDbPerRaw = 0.5;
constexpr double kSnrDbPerRaw = 0.31;

// Halves round toward +inf.
double roundToTenth(double value) {
  return std::floor(value * 10.0 + 0.5) / 10.0;
}

} // namespace

SignalEstimate estimateSignal(int signalRaw, int snrRaw) {
  SignalBucket bucket = kWeakBucket;
  for (const SignalBucket &candidate : kSignalBuckets) {
    if (signalRaw >= candidate.lowerRaw) {
      bucket = candidate;
      break;
    }
  }

  const double signalDbm =
      bucket.baseDbm -
      static_cast<double>(bucket.upperRaw - signalRaw) * kSignalSlopeDbPerRaw;

  SignalEstimate out{};
  out.ssDb = roundToTenth(signalDbm);
  out.snrDb =
      snrRaw > 0 ? roundToTenth(static_cast<double>(snrRaw) * kSnrDbPerRaw)
                 : 0.0;
  return out;
}

#ifndef SIGNAL_ESTIMATE_H
#define SIGNAL_ESTIMATE_H

struct SignalEstimate {
  double ssDb = 0.0;
  double snrDb = 0.0;
};

// Maps the tuner's raw debug counter pair (dbg=<signal>-<snr>/...) to an
// approximate dBm / dB reading. The vendor does not document the counters;
// the bucket boundaries and slopes below come from field observation
// (raw 9..86 roughly spans -80..-40 dBm on ATSC) and are pending
// calibration against a reference meter.
SignalEstimate estimateSignal(int signalRaw, int snrRaw);

#endif

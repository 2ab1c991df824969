#include "modes.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - sweep   : drive the bench through one ASE threshold sweep.
    - watch   : connect to a sweep's preview stream.
    - inspect : verify a run directory or dump a raw spectrum file.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  asesweep sweep   [--save-dir=runs] [--start=85] [--end=280] [--count=50]\n"
        << "                   [--angles=85,140,280]\n"
        << "                   [--presets=4,0.1] [--accumulations=1] [--saturation=65530]\n"
        << "                   [--saturation-warning=50000] [--exposure-resume=last|longest]\n"
        << "                   [--reset-after-failure] [--no-denoise] [--denoise-factor=50]\n"
        << "                   [--pulse-width=5e-6] [--pulse-period=0.1] [--pulse-voltage=5]\n"
        << "                   [--wavelength=450] [--grating=1] [--mirror=front|side]\n"
        << "                   [--cooling-threshold=-50] [--cooling-target=-70]\n"
        << "                   [--cooling-timeout=600] [--cooling-poll=5] [--on-cooling-timeout=abort|warn]\n"
        << "                   [--settle-after-move=0.5] [--settle-after-trigger=0.5] [--fatal-retries=0]\n"
        << "                   [--motor-port=..] [--motor-address=0] [--pulser-port=..] [--spectrometer-id=..]\n"
        << "                   [--motor-timeout=180] [--acq-timeout-margin=30]\n"
        << "                   [--backend=sim] [--sim-time-scale=0]\n"
        << "                   [--view] [--preview-port=0] [--preview-png] [--verbose]\n"
        << "  asesweep watch   [--server=localhost:50051] [--view] [--save=preview.png]\n"
        << "  asesweep inspect --run=<run dir> | --file=<raw .spf>\n"
        << "  Ctrl+C during a sweep stops after the current step; a second Ctrl+C exits at once.\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 1; }
    const std::string mode = argv[1];

    if      (mode == "sweep")   return run_sweep  (argc, argv);
    else if (mode == "watch")   return run_watch  (argc, argv);
    else if (mode == "inspect") return run_inspect(argc, argv);
    else if (mode == "help" || mode == "--help" || mode == "-h") { print_usage(); return 0; }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}

#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value is the process exit code. */

/* Run one acquisition sweep.
   Exit code: 0 completed, 2 aborted on an error, 3 cancelled (Ctrl+C), 1 bad options.
   Example:
     asesweep sweep --start=85 --end=280 --count=50 --presets=4,0.1 --view --preview-port=50051 */
int run_sweep  (int argc, char** argv);

/* Follow the live preview of a running sweep over gRPC.
   Example:
     asesweep watch --server=localhost:50051 --view */
int run_watch  (int argc, char** argv);

/* Check a finished (or interrupted) run directory, or dump one raw .spf file.
   Example:
     asesweep inspect --run=runs/20260131_Measurement_1
     asesweep inspect --file=runs/.../Raw_Data/x.spf */
int run_inspect(int argc, char** argv);

#pragma once

#include "asesweep/preview/PreviewSink.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>

namespace asesweep {

class RunLog;

struct PlotOptions {
    int width  = 960;
    int height = 600;
};

/* Signal, background and net of one point on a common axis, BGR 8-bit. */
cv::Mat renderSpectra(const PreviewUpdate& u, const PlotOptions& opt = {});

/* Writes the plot; logs the outcome, returns false on failure. */
bool savePreviewPng(const cv::Mat& plot, const std::filesystem::path& path, RunLog& log);

/*
  HighGUI window for the live plot.
  The constructor throws cv::Exception when no display is available.
*/
class PreviewWindow {
public:
    explicit PreviewWindow(std::string title = "ASE sweep");
    ~PreviewWindow();

    PreviewWindow(const PreviewWindow&)            = delete;
    PreviewWindow& operator=(const PreviewWindow&) = delete;

    void show(const cv::Mat& img);
    // Pumps GUI events; returns the key pressed or -1.
    int poll(int ms = 1);

private:
    std::string title_;
};

} // namespace asesweep

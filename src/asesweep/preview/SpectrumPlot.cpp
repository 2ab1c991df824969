#include "asesweep/preview/SpectrumPlot.hpp"
#include "asesweep/io/RunLog.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace asesweep {

namespace {

const cv::Scalar kSignal(40, 40, 220);
const cv::Scalar kBackground(150, 150, 150);
const cv::Scalar kNet(200, 90, 10);
const cv::Scalar kInk(30, 30, 30);

struct Range { double lo, hi; };

void extend(Range& r, const std::vector<double>& v) {
    for (double x : v) {
        if (!std::isfinite(x)) continue;
        r.lo = std::min(r.lo, x);
        r.hi = std::max(r.hi, x);
    }
}

std::string num(double v, int prec) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

void curve(cv::Mat& img, const cv::Rect& area, const Frame& f,
           const Range& xr, const Range& yr, const cv::Scalar& color)
{
    const std::size_t n = std::min(f.wavelengthNm.size(), f.counts.size());
    if (n < 2) return;
    std::vector<cv::Point> pts;
    pts.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double fx = (f.wavelengthNm[i] - xr.lo) / (xr.hi - xr.lo);
        const double fy = (f.counts[i] - yr.lo) / (yr.hi - yr.lo);
        pts.emplace_back(area.x + static_cast<int>(std::lround(fx * area.width)),
                         area.y + area.height - static_cast<int>(std::lround(fy * area.height)));
    }
    cv::polylines(img, pts, false, color, 1, cv::LINE_AA);
}

} // namespace

cv::Mat renderSpectra(const PreviewUpdate& u, const PlotOptions& opt)
{
    cv::Mat img(opt.height, opt.width, CV_8UC3, cv::Scalar(255, 255, 255));
    const cv::Rect area(70, 50, std::max(10, opt.width - 100), std::max(10, opt.height - 110));

    const Frame* frames[] = {u.signal.get(), u.background.get(), u.net.get()};
    Range xr{std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest()};
    Range yr = xr;
    for (const Frame* f : frames) {
        if (!f) continue;
        extend(xr, f->wavelengthNm);
        extend(yr, f->counts);
    }

    std::ostringstream title;
    title << "#" << (u.index + 1) << "/" << u.total
          << "  " << num(u.angleDeg, 2) << " deg"
          << "  t=" << u.integrationTimeS << " s"
          << "  max=" << num(u.maxCount, 0)
          << "  bg " << (u.backgroundFromCache ? "cached" : "acquired");
    if (!u.state.empty()) title << "  [" << u.state << "]";
    cv::putText(img, title.str(), {area.x, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.55, kInk, 1, cv::LINE_AA);
    cv::rectangle(img, area, kInk, 1);

    if (xr.lo >= xr.hi || yr.lo > yr.hi) {
        cv::putText(img, "no data", {area.x + area.width / 2 - 40, area.y + area.height / 2},
                    cv::FONT_HERSHEY_SIMPLEX, 0.8, kInk, 1, cv::LINE_AA);
        return img;
    }
    if (yr.hi - yr.lo < 1.0) { yr.lo -= 0.5; yr.hi += 0.5; }
    const double pad = 0.05 * (yr.hi - yr.lo);
    yr.lo -= pad;
    yr.hi += pad;

    // ticks
    constexpr int kTicks = 5;
    for (int i = 0; i <= kTicks; ++i) {
        const double fx = static_cast<double>(i) / kTicks;
        const int x = area.x + static_cast<int>(fx * area.width);
        cv::line(img, {x, area.y + area.height}, {x, area.y + area.height + 5}, kInk, 1);
        cv::putText(img, num(xr.lo + fx * (xr.hi - xr.lo), 1), {x - 22, area.y + area.height + 22},
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, kInk, 1, cv::LINE_AA);

        const int y = area.y + area.height - static_cast<int>(fx * area.height);
        cv::line(img, {area.x - 5, y}, {area.x, y}, kInk, 1);
        cv::putText(img, num(yr.lo + fx * (yr.hi - yr.lo), 0), {4, y + 4},
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, kInk, 1, cv::LINE_AA);
    }
    cv::putText(img, "wavelength (nm)", {area.x + area.width / 2 - 60, opt.height - 12},
                cv::FONT_HERSHEY_SIMPLEX, 0.45, kInk, 1, cv::LINE_AA);

    if (u.background) curve(img, area, *u.background, xr, yr, kBackground);
    if (u.signal)     curve(img, area, *u.signal,     xr, yr, kSignal);
    if (u.net)        curve(img, area, *u.net,        xr, yr, kNet);

    // legend
    int ly = area.y + 18;
    auto legend = [&](const char* label, const cv::Scalar& c) {
        const int lx = area.x + area.width - 130;
        cv::line(img, {lx, ly - 4}, {lx + 24, ly - 4}, c, 2);
        cv::putText(img, label, {lx + 30, ly}, cv::FONT_HERSHEY_SIMPLEX, 0.45, kInk, 1, cv::LINE_AA);
        ly += 18;
    };
    legend("signal", kSignal);
    legend("background", kBackground);
    legend("net", kNet);
    return img;
}

bool savePreviewPng(const cv::Mat& plot, const std::filesystem::path& path, RunLog& log)
{
    if (plot.empty()) {
        log.warn("preview", "plot is empty, nothing to save");
        return false;
    }
    if (cv::imwrite(path.string(), plot)) {
        log.debug("preview", "saved " + path.string());
        return true;
    }
    log.warn("preview", "failed to save " + path.string());
    return false;
}

PreviewWindow::PreviewWindow(std::string title) : title_(std::move(title))
{
    cv::namedWindow(title_, cv::WINDOW_NORMAL);
    cv::resizeWindow(title_, 960, 600);
}

PreviewWindow::~PreviewWindow()
{
    try {
        cv::destroyWindow(title_);
    } catch (const cv::Exception&) {
        // display already gone
    }
}

void PreviewWindow::show(const cv::Mat& img)
{
    cv::imshow(title_, img);
    cv::waitKey(1);
}

int PreviewWindow::poll(int ms) { return cv::waitKey(ms); }

} // namespace asesweep

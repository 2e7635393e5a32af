#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "attitude/core/angular/timestamped_angular_coordinates.hpp"
#include "attitude/core/interpolation/angular_interpolation.hpp"
#include "attitude/ephemeris/attitude_ephemeris.hpp"

using attitude::core::AngularSample;
using attitude::core::DerivativeFilter;
using attitude::core::Quat;
using attitude::core::Status;
using attitude::core::TimeStampedAngularCoordinates;
using attitude::core::Vec3;
using attitude::core::ok;
using attitude::ephemeris::AttitudeEphemeris;
using attitude::ephemeris::AttitudeEphemerisOptions;

static int parseIntArg(int argc, char** argv, const char* key, int def) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::stoi(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::stoi(std::string(argv[i] + prefix.size()));
    }
  }
  return def;
}

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

// Tumbling body: rate about a slowly precessing axis, one entry per second.
static std::vector<TimeStampedAngularCoordinates> makeBenchTable(int entries) {
  std::vector<TimeStampedAngularCoordinates> table;
  table.reserve(static_cast<std::size_t>(entries));
  const Vec3 axis = Vec3(0.3, -0.5, 1.0).normalized();
  const Vec3 rate = 0.4 * axis;
  for (int i = 0; i < entries; ++i) {
    const double t = static_cast<double>(i);
    const Quat q(Eigen::AngleAxisd(0.4 * t, axis));
    table.emplace_back(t, q, rate);
  }
  return table;
}

template <typename Fn>
static double benchMs(Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  fn();
  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double, std::milli> dt = t1 - t0;
  return dt.count();
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 ||
                   std::strcmp(argv[1], "-h") == 0)) {
    std::cout << "Usage: attitude_benchmark [--points=N] [--iters=N] [--entries=N]\n";
    std::cout << "  Optional: --trials=N --warmup=N --quiet\n";
    return 0;
  }

  const int points = parseIntArg(argc, argv, "--points", 4);
  const int iters = parseIntArg(argc, argv, "--iters", 20000);
  const int entries = parseIntArg(argc, argv, "--entries", 1000);
  const int trials = parseIntArg(argc, argv, "--trials", 5);
  const int warmup = parseIntArg(argc, argv, "--warmup", 1);
  const bool quiet = parseFlag(argc, argv, "--quiet");

  if (points < 2 || entries < points) {
    std::cerr << "need --points >= 2 and --entries >= --points\n";
    return 1;
  }

  const std::vector<TimeStampedAngularCoordinates> table = makeBenchTable(entries);
  const AngularSample sample(table.begin(), table.begin() + points);
  const double span = static_cast<double>(points - 1);

  AttitudeEphemerisOptions eph_opt;
  eph_opt.interpolation_points = points;
  AttitudeEphemeris eph;
  if (!ok(eph.init(table, eph_opt))) {
    std::cerr << "AttitudeEphemeris init failed\n";
    return 1;
  }

  double acc = 0.0;
  TimeStampedAngularCoordinates out;

  auto run_interp = [&](DerivativeFilter filter) {
    for (int i = 0; i < iters; ++i) {
      const double t = span * static_cast<double>(i) / static_cast<double>(iters);
      const Status st = attitude::core::interpolateAngular(t, filter, sample, &out);
      if (!ok(st)) {
        std::cerr << "interpolateAngular failed\n";
        std::exit(1);
      }
      acc += out.rotation().w();
    }
  };

  auto run_eph = [&]() {
    const double t_max = static_cast<double>(entries - 1);
    for (int i = 0; i < iters; ++i) {
      const double t = t_max * static_cast<double>(i) / static_cast<double>(iters);
      const Status st = eph.getAttitude(t, &out);
      if (!ok(st)) {
        std::cerr << "getAttitude failed\n";
        std::exit(1);
      }
      acc += out.rate().x();
    }
  };

  std::vector<double> r_runs;
  std::vector<double> rr_runs;
  std::vector<double> rra_runs;
  std::vector<double> eph_runs;
  r_runs.reserve(trials);
  rr_runs.reserve(trials);
  rra_runs.reserve(trials);
  eph_runs.reserve(trials);

  for (int i = 0; i < warmup; ++i) {
    run_interp(DerivativeFilter::UseR);
    run_interp(DerivativeFilter::UseRR);
    run_interp(DerivativeFilter::UseRRA);
    run_eph();
  }

  for (int i = 0; i < trials; ++i) {
    r_runs.push_back(benchMs([&]() { run_interp(DerivativeFilter::UseR); }));
    rr_runs.push_back(benchMs([&]() { run_interp(DerivativeFilter::UseRR); }));
    rra_runs.push_back(benchMs([&]() { run_interp(DerivativeFilter::UseRRA); }));
    eph_runs.push_back(benchMs([&]() { run_eph(); }));
    if (!quiet) {
      std::cout << "trial " << (i + 1) << "/" << trials << " done\n";
    }
  }

  auto median = [](std::vector<double> v) {
    if (v.empty()) return 0.0;
    std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
    return v[v.size() / 2];
  };

  const double r_ms = median(r_runs);
  const double rr_ms = median(rr_runs);
  const double rra_ms = median(rra_runs);
  const double eph_ms = median(eph_runs);

  std::cout << "attitude_benchmark\n";
  std::cout << "  points: " << points << ", entries: " << entries << "\n";
  std::cout << "  trials: " << trials << " (warmup " << warmup << ")\n";
  std::cout << "  interpolateAngular USE_R:   " << r_ms << " ms total, "
            << (r_ms * 1000.0 / iters) << " us/call\n";
  std::cout << "  interpolateAngular USE_RR:  " << rr_ms << " ms total, "
            << (rr_ms * 1000.0 / iters) << " us/call\n";
  std::cout << "  interpolateAngular USE_RRA: " << rra_ms << " ms total, "
            << (rra_ms * 1000.0 / iters) << " us/call\n";
  std::cout << "  AttitudeEphemeris::getAttitude: " << eph_ms << " ms total, "
            << (eph_ms * 1000.0 / iters) << " us/call\n";

  if (acc == 0.123456) {
    std::cout << "ignore: " << acc << "\n";
  }
  return 0;
}

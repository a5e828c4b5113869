#include "femtag/femtag.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

// User names must be unique among live materials.
std::string bench_name() {
  static std::uint64_t counter = 0;
  return "bench" + std::to_string(counter++);
}

struct BenchMaterial final : femtag::Material {
  explicit BenchMaterial(femtag::MaterialRegistry& registry)
      : femtag::Material(registry, "nDMaterial", "ElasticIsotropic", bench_name()) {}
  std::string to_tcl() const override { return {}; }
};

std::uint32_t xorshift32(std::uint32_t& state) {
  std::uint32_t x = state;
  x ^= x << 13;
  x ^= x >> 17;
  x ^= x << 5;
  state = x;
  return x;
}

void report(const char* name, std::size_t ops, std::chrono::nanoseconds elapsed, std::int64_t sink) {
  const auto ns = elapsed.count();
  std::cout << name << "\n";
  std::cout << "ops: " << ops << "\n";
  std::cout << "total: " << static_cast<double>(ns) / 1e6 << " ms\n";
  std::cout << "ns/op: " << static_cast<double>(ns) / static_cast<double>(ops) << "\n";
  std::cout << "sink: " << sink << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t live = 2000;
  std::size_t rounds = 200;
  bool run_remove = true;
  bool run_start = true;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--remove") {
      run_start = false;
      continue;
    }
    if (arg == "--start") {
      run_remove = false;
      continue;
    }
    if (!arg.empty() && std::isdigit(static_cast<unsigned char>(arg[0]))) {
      live = static_cast<std::size_t>(std::stoull(arg));
    }
  }

  femtag::log::set_level(femtag::log::Level::Warning);
  femtag::MaterialRegistry reg;
  std::uint32_t rng = 0x12345678u;

  if (run_remove) {
    // Remove a random entity and add a fresh one, keeping the live count fixed.
    std::vector<std::unique_ptr<BenchMaterial>> pool;
    pool.reserve(live);
    for (std::size_t i = 0; i < live; ++i) {
      pool.push_back(std::make_unique<BenchMaterial>(reg));
    }

    const std::size_t ops = live * rounds;
    std::int64_t sink = 0;
    const auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < ops; ++i) {
      const std::size_t pos = xorshift32(rng) % pool.size();
      if (!femtag::ok(reg.remove(pool[pos]->tag()))) {
        std::cerr << "remove failed at op " << i << "\n";
        return 1;
      }
      pool[pos] = std::make_unique<BenchMaterial>(reg);
      sink += pool[pos]->tag();
    }
    const auto end_time = std::chrono::steady_clock::now();
    report("TagRegistry remove+add (dense renumber)", ops, end_time - start, sink);
    reg.reset();
  }

  if (run_start) {
    std::vector<std::unique_ptr<BenchMaterial>> pool;
    for (std::size_t i = 0; i < live; ++i) {
      pool.push_back(std::make_unique<BenchMaterial>(reg));
    }

    std::int64_t sink = 0;
    const auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < rounds; ++i) {
      const auto new_start = static_cast<femtag::Tag>(1 + xorshift32(rng) % 100000);
      if (!femtag::ok(reg.set_start(new_start))) {
        std::cerr << "set_start failed at round " << i << "\n";
        return 1;
      }
      sink += pool.back()->tag();
    }
    const auto end_time = std::chrono::steady_clock::now();
    report("TagRegistry set_start (full renumber)", rounds, end_time - start, sink);
  }
  return 0;
}

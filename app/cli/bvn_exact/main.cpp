#include <gb/config/sampler_config.hpp>
#include <gb/core/errors.hpp>
#include <gb/io/sample_text.hpp>
#include <gb/sampling/runner.hpp>

#include <iostream>
#include <string>
#include <cstdlib>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " N RHO\n"
            << "Writes N independent exact samples (x y per line) to stdout.\n";
}

int main(int argc, char** argv) {
  if (argc != 3) {
    print_usage(argv[0]);
    return 1;
  }

  long long n;
  double rho;
  try {
    std::size_t pos_n = 0, pos_rho = 0;
    const std::string sn = argv[1], srho = argv[2];
    n   = std::stoll(sn, &pos_n);
    rho = std::stod(srho, &pos_rho);
    if (pos_n != sn.size() || pos_rho != srho.size()) {
      print_usage(argv[0]);
      return 1;
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const gb::config::SamplerConfig cfg(n, rho, gb::core::DEFAULT_SEED,
                                        gb::config::Method::Exact);
    const auto samples = gb::sampling::run_sampler(cfg);
    gb::io::write_samples(std::cout, samples);
  } catch (const gb::core::InvalidParameter& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}

#include <gb/io/sample_text.hpp>
#include <gb/qc/summary.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [samples.txt]\n"
              << "Reads x y pairs (stdin if no file) and prints a summary.\n";
    return 1;
  }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  std::vector<gb::core::Sample> samples;
  try {
    samples = (argc == 2)
                ? gb::io::read_samples_file(argv[1], &ignored, &warnings)
                : gb::io::read_samples(std::cin, &ignored, &warnings);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  if (ignored > 0) std::cerr << "Ignored lines: " << ignored << "\n";

  if (samples.empty()) {
    std::cerr << "Error: no valid sample\n";
    return 2;
  }

  gb::qc::print_summary(std::cout, gb::qc::summarize(samples));
  return 0;
}

#include "gb/io/sample_text.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
using namespace std;
using gb::core::Sample;

int main() {
  // Format exact : 3 décimales, un espace, '\n'
  {
    vector<Sample> v{{0.0, 0.0}, {1.23456, -0.5}, {-12.0, 3.0004}};
    ostringstream os;
    gb::io::write_samples(os, v);
    assert(os.str() == "0.000 0.000\n1.235 -0.500\n-12.000 3.000\n");
    // le flux n'est pas laissé en mode fixed
    os << 0.5;
    assert(os.str().substr(os.str().size() - 3) == "0.5");
  }
  {
    ostringstream os;
    gb::io::write_samples(os, {});
    assert(os.str().empty());
  }

  // Lecture tolérante
  {
    istringstream is(
        "# x y\n"
        "0.000 0.000\n"
        "\n"
        "  1.5\t-2.25  \r\n"
        "3.0\n"              // champ manquant
        "1 2 3\n"            // champ en trop
        "abc 1.0\n"          // non numérique
        "1.0e0 2.0x\n"       // garbage en fin de champ
        "-0.125 0.5\n");
    size_t ignored = 0;
    vector<string> warnings;
    const auto rows = gb::io::read_samples(is, &ignored, &warnings);
    assert(rows.size() == 3);
    assert(ignored == 4);
    assert(warnings.size() == 4);
    assert((rows[0] == Sample{0.0, 0.0}));
    assert((rows[1] == Sample{1.5, -2.25}));
    assert((rows[2] == Sample{-0.125, 0.5}));

    auto has_warn = [&](const string& needle){
      return any_of(warnings.begin(), warnings.end(),
                    [&](const string& w){ return w.find(needle) != string::npos; });
    };
    assert(has_warn("line 5: missing second field"));
    assert(has_warn("more than two fields"));
    assert(has_warn("non numeric field"));
  }

  // Écriture puis relecture : valeurs arrondies à 1e-3
  {
    vector<Sample> v{{0.1234, -0.9876}, {2.0, -3.0}};
    stringstream ss;
    gb::io::write_samples(ss, v);
    const auto back = gb::io::read_samples(ss);
    assert(back.size() == v.size());
    for (size_t i = 0; i < v.size(); ++i) {
      assert(std::abs(back[i].x - v[i].x) <= 5e-4 + 1e-12);
      assert(std::abs(back[i].y - v[i].y) <= 5e-4 + 1e-12);
    }
  }

  // Fichier absent
  bool thrown = false;
  try { gb::io::read_samples_file("/nonexistent/dir/samples.txt"); }
  catch (const std::runtime_error&) { thrown = true; }
  assert(thrown);

  cout << "Sample text OK.\n";
  return 0;
}

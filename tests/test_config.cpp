// SPDX-License-Identifier: MIT

#include "qcl/config.hpp"
#include <iostream>
#include <sstream>

using namespace qcl;

static int fails=0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++fails; } }while(0)

static std::optional<ClassifierOptions> parse(const std::string& text, std::string& err){
  std::istringstream in(text);
  return parse_options(in, err);
}

int main(){
  {
    std::string err;
    auto o = parse("# classifier\nnqubit = 5\nc_depth=2\nnum_class=4\n"
                   "time_step=0.5\nseed=42\nlayer_axes=YZ  # two rotations\n"
                   "gradient=adjoint\nreport_interval=7\ngtol=1e-6\nverbose=false\n", err);
    CHECK(o.has_value());
    if (o){
      CHECK(o->nqubit == 5 && o->c_depth == 2 && o->num_class == 4);
      CHECK(o->time_step == 0.5 && o->seed == 42 && o->report_interval == 7 && o->gtol == 1e-6);
      CHECK(o->layer_axes.size() == 2 && o->layer_axes[0] == Axis::Y && o->layer_axes[1] == Axis::Z);
      CHECK(o->gradient == GradientMethod::Adjoint);
      CHECK(o->log == nullptr);
    }
  }
  {
    std::string err;
    auto o = parse("", err);
    CHECK(o && o->nqubit == 4 && o->c_depth == 4 && o->num_class == 3 && o->layer_axes.size() == 3);
  }
  {
    std::string err;
    CHECK(!parse("layer_axes=XW\n", err));
    CHECK(err.find("line 1") != std::string::npos);
    CHECK(!parse("nqubit=4\nlearning_rate=0.1\n", err));
    CHECK(err.find("learning_rate") != std::string::npos);
    CHECK(!parse("nqubit=2\nnum_class=3\n", err));
    CHECK(!parse("nqubit=-1\n", err));
    CHECK(!parse("nqubit=0\n", err));
    CHECK(!parse("gradient=finite\n", err));
    CHECK(!parse("gtol=-1\n", err));
    CHECK(err.find("gtol") != std::string::npos);
    CHECK(!parse("gtol=0\n", err));
    CHECK(!parse("c_depth\n", err));
    CHECK(!load_options("/nonexistent/qcl.conf", err));
  }
  {
    CHECK(axis_from_char('x') == Axis::X && axis_from_char('Z') == Axis::Z);
    bool threw = false;
    try { axis_from_char('W'); } catch (const UnsupportedAxis&) { threw = true; }
    CHECK(threw);
  }

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}

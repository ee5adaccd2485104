// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <cmath>

namespace rqh::gates {
  inline void X_coeffs(rqh::c64& u00, rqh::c64& u01, rqh::c64& u10, rqh::c64& u11) {
    u00 = {0,0}; u01 = {1,0}; u10 = {1,0}; u11 = {0,0};
  }
  inline void RZ_coeffs(double theta, rqh::c64& u00, rqh::c64& u01, rqh::c64& u10, rqh::c64& u11) {
    // diag(e^{-iθ/2}, e^{iθ/2})
    double half = theta/2.0;
    u00 = { std::cos(-half), std::sin(-half) };
    u11 = { std::cos( half), std::sin( half) };
    u01 = {0,0}; u10 = {0,0};
  }
  inline void RX_coeffs(double theta, rqh::c64& u00, rqh::c64& u01, rqh::c64& u10, rqh::c64& u11){
    double c = std::cos(theta/2.0);
    double s = std::sin(theta/2.0);
    u00 = {c,0}; u01 = {0,-s}; u10 = {0,-s}; u11 = {c,0};
  }
}

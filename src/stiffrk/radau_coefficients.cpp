#include <math.h>

#include "radau_coefficients.h"

namespace stiffrk
{

RadauCoefficients::RadauCoefficients()
{
  const double sq6 = sqrt(6.0);
  c1 = (4.0 - sq6) / 10.0;
  c2 = (4.0 + sq6) / 10.0;
  c1m1 = c1 - 1.0;
  c2m1 = c2 - 1.0;
  c1mc2 = c1 - c2;

  dd[0] = -(13.0 + 7.0 * sq6) / 3.0;
  dd[1] = (-13.0 + 7.0 * sq6) / 3.0;
  dd[2] = -1.0 / 3.0;

  const double st9 = pow(9.0, 1.0/3.0);
  u1 = 30.0/(6.0 + st9 * (st9 - 1.0));
  const double alp = (12.0 - st9 * (st9 - 1.0)) / 60.0;
  const double bet = st9 * (st9 + 1.0) * sqrt(3.0) / 60.0;
  const double cno = alp * alp + bet * bet;
  alpha = alp / cno;
  beta  = bet / cno;

  t[0][0] =  9.1232394870892942792e-02;
  t[0][1] = -0.14125529502095420843;
  t[0][2] = -3.0029194105147424492e-02;
  t[1][0] =  0.24171793270710701896;
  t[1][1] =  0.20412935229379993199;
  t[1][2] =  0.38294211275726193779;
  t[2][0] =  0.96604818261509293619;
  t[2][1] =  1.0;
  t[2][2] =  0.0;

  ti[0][0] =  4.325579890063155351024;
  ti[0][1] =  0.3391992518158098695428;
  ti[0][2] =  0.5417705399358748711865;
  ti[1][0] = -4.178718591551904727346;
  ti[1][1] = -0.3276828207610623870825;
  ti[1][2] =  0.4766235545005504519601;
  ti[2][0] = -0.5028726349457868759512;
  ti[2][1] =  2.571926949855605429187;
  ti[2][2] = -0.5960392048282249249688;
}

} // namespace stiffrk

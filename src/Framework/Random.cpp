/*************************************************************************
 *  ./src/Framework/Random.cpp
 *  Copyright Chris Jewell <chrism0dwk@gmail.com> 2012
 *
 *  This file is part of EpiSpread.
 *
 *  EpiSpread is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  EpiSpread is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with EpiSpread.  If not, see <http://www.gnu.org/licenses/>.
 *************************************************************************/
/*
 * Random.cpp
 *
 *  Created on: Oct 27, 2010
 *      Author: stsiab
 */

#include <stdexcept>

#include "Random.hpp"


namespace EpiSpread
{

  Random::Random(const unsigned long int seed) : seed_(seed)
  {
    rng_ = gsl_rng_alloc(gsl_rng_mt19937);
    if (rng_ == NULL)
      throw std::runtime_error("Unable to allocate random number generator");
    gsl_rng_set(rng_,seed);

  }

  Random::~Random()
  {
    gsl_rng_free(rng_);
  }
  double
  Random::uniform(const double a, const double b)
  {
    return gsl_ran_flat(rng_, a, b);
  }
  size_t
  Random::integer(const size_t n)
  {
    if (n == 0)
      throw std::invalid_argument("Random::integer requires n > 0");
    return gsl_rng_uniform_int(rng_, n);
  }
  bool
  Random::bernoulli(const double p)
  {
    // Exactly one draw per call, whatever p is
    return gsl_rng_uniform(rng_) < p;
  }
  unsigned long int
  Random::getSeed() const
  {
    return seed_;
  }

}

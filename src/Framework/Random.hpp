/*************************************************************************
 *  ./src/Framework/Random.hpp
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
 * Random.hpp
 *
 *  Created on: Oct 27, 2010
 *      Author: stsiab
 */

#ifndef RANDOM_HPP_
#define RANDOM_HPP_

#include <cstddef>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>

namespace EpiSpread
{

  /*! \brief Seedable source of random variates
   *
   * Wraps a Mersenne Twister gsl_rng.  Two instances constructed
   * with the same seed produce identical streams.  Not copyable.
   */
  class Random
  {
    gsl_rng* rng_;
    unsigned long int seed_;

    Random(const Random&);
    Random&
    operator=(const Random&);
  public:

    Random(const unsigned long int seed);
    virtual
    ~Random();
    //! Uniform variate on [a,b)
    double
    uniform(const double a=0, const double b=1);
    //! Uniform integer on {0,...,n-1}
    size_t
    integer(const size_t n);
    //! Returns true with probability p
    bool
    bernoulli(const double p);
    unsigned long int
    getSeed() const;
  };

}

#endif /* RANDOM_HPP_ */

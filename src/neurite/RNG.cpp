/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include "RNG.hpp"

#include <cmath>
#include <boost/random.hpp>

namespace neurite {

unsigned
urand(RNG* rng)
{
	unsigned t = (rng->state[0]^(rng->state[0]<<11));
	rng->state[0] = rng->state[1];
	rng->state[1] = rng->state[2];
	rng->state[2] = rng->state[3];
	rng->state[3] = (rng->state[3]^(rng->state[3]>>19))^(t^(t>>8));
	return rng->state[3];
}



/* Box-Muller. Only one of the pair of samples is used. */
double
nrand(RNG* rng)
{
	double a = urand(rng) * 1.4629180792671596810513378043098e-9;
	double b = urand(rng) * 0.00000000023283064365386962890625;
	double r = std::sqrt(-2.0 * std::log(1.0 - b));
	return std::sin(a) * r;
}



void
initialiseRng(unsigned seed, std::vector<RNG>& rngs)
{
	typedef boost::mt19937 rng_t;
	rng_t rng(seed);

	boost::variate_generator<rng_t, boost::uniform_int<unsigned long> >
		gen(rng, boost::uniform_int<unsigned long>(1, 0x7fffffff));

	for(std::vector<RNG>::iterator i = rngs.begin(); i != rngs.end(); ++i) {
		for(unsigned plane=0; plane < 4; ++plane) {
			i->state[plane] = gen();
		}
	}
}


} // end namespace

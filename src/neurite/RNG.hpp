#ifndef NEURITE_RNG_HPP
#define NEURITE_RNG_HPP

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <vector>
#include <neurite/config.h>

namespace neurite {

/*! Per-unit xorshift generator state */
struct NEURITE_DLL_PUBLIC RNG {
	unsigned state[4];
};


/*! \return uniform random 32-bit number */
NEURITE_DLL_PUBLIC unsigned urand(RNG* rng);

/*! \return normal random number drawn from N(0, 1) */
NEURITE_DLL_PUBLIC double nrand(RNG* rng);


/* Generates RNG seeds for all the generators in the output vector from a
 * single Mersenne twister seeded with \a seed. The mapping from unit index to
 * seed values is thus fixed for a given seed. */
NEURITE_DLL_PUBLIC
void
initialiseRng(unsigned seed, std::vector<RNG>& rngs);

} // end namespace

#endif

#ifndef NEURITE_TYPES_H
#define NEURITE_TYPES_H

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <stdint.h>

/*! The call resulted in no errors */
#define NEURITE_OK 0

#define NEURITE_INVALID_INPUT 1

/*! Invalid construction-time parameters: unit counts, connectivity, time
 * constants, parameter or field names */
#define NEURITE_CONFIGURATION_ERROR 2

/*! Integration produced a non-finite value, or the timestep is not positive */
#define NEURITE_NUMERICAL_ERROR 3

/*! A delay line could not be given a capacity of at least one slot */
#define NEURITE_BUFFER_UNDERFLOW 4

#define NEURITE_LOGIC_ERROR 5
#define NEURITE_IO_ERROR 6
#define NEURITE_UNKNOWN_ERROR 7

/*! Numerical integration schemes */
enum {
	NEURITE_EULER,
	NEURITE_EXPONENTIAL_EULER
};

typedef unsigned scheme_t;
typedef unsigned long long cycle_t;

typedef unsigned nidx_t; // unit index within a group
typedef unsigned sidx_t; // edge index within a connection map

#endif

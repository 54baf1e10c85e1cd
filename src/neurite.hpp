#ifndef NEURITE_HPP
#define NEURITE_HPP

//! \file neurite.hpp

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file neurite.hpp C++ API
 *
 * Top-level include file. This pulls in the simulation core along with the
 * full catalogue of neuron and synapse models.
 */

#include <neurite/Configuration.hpp>
#include <neurite/ConnectionMap.hpp>
#include <neurite/Monitor.hpp>
#include <neurite/Network.hpp>
#include <neurite/Stimulus.hpp>
#include <neurite/exception.hpp>
#include <neurite/types.h>

#include <neurite/neurons/HindmarshRose.hpp>
#include <neurite/neurons/HodgkinHuxley.hpp>
#include <neurite/neurons/Izhikevich.hpp>
#include <neurite/neurons/LIF.hpp>

#include <neurite/synapses/Alpha.hpp>
#include <neurite/synapses/Exponential.hpp>
#include <neurite/synapses/NMDA.hpp>
#include <neurite/synapses/VoltageJump.hpp>


namespace neurite {

/*! \return version number of the neurite library */
NEURITE_DLL_PUBLIC
const char*
version();

}

#endif

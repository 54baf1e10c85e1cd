#ifndef NEURITE_LOG_HPP
#define NEURITE_LOG_HPP

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

/* Logging goes to stdout. LOG is switched at run-time (see
 * Configuration::enableLogging), TRACE only exists in builds configured with
 * NEURITE_DEBUG_TRACE since it is called for every spike. */

#include <cstdio>

#include <neurite/config.h>

#define LOG(cond, ...) if(cond) { fprintf(stdout, __VA_ARGS__); fprintf(stdout, "\n"); }

#ifdef NEURITE_DEBUG_TRACE
#define TRACE(...) fprintf(stdout, __VA_ARGS__);
#else
#define TRACE(...)
#endif

#endif

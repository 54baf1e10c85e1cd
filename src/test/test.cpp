#define BOOST_TEST_MODULE neurite test

/* Copyright 2010 Imperial College London
 * Copyright 2026 The neurite developers
 *
 * This file is part of neurite.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurite. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cmath>
#include <limits>
#include <sstream>

#include <boost/bind.hpp>
#include <boost/filesystem.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/test/unit_test.hpp>

#include <neurite.hpp>
#include <neurite/DelayLine.hpp>
#include <neurite/Integrator.hpp>
#include <neurite/Parameters.hpp>
#include <neurite/RNG.hpp>
#include <neurite/StateVector.hpp>
#include <neurite/rates.hpp>

#include "utils.hpp"

using namespace neurite;

typedef boost::shared_ptr<NeuronGroup> neurons_ptr;
typedef boost::shared_ptr<SynapseGroup> synapses_ptr;


/* Derivative functions for the integrator tests */

void
constantSlope(double /* t */, const double* /* y */, const double* aux,
		double dydt[], double* /* linear */)
{
	dydt[0] = aux[0];
}


void
linearDecay(double tau, double /* t */, const double y[], const double* /* aux */,
		double dydt[], double linear[])
{
	dydt[0] = -y[0] / tau;
	linear[0] = -1.0 / tau;
}


void
notANumber(double /* t */, const double* /* y */, const double* /* aux */,
		double dydt[], double* /* linear */)
{
	dydt[0] = std::numeric_limits<double>::quiet_NaN();
}


void
stationary(double /* t */, const double* /* y */, const double* /* aux */,
		double dydt[], double* /* linear */)
{
	dydt[0] = 0.0;
}



BOOST_AUTO_TEST_SUITE(rates)

BOOST_AUTO_TEST_CASE(alpha_m_at_singularity)
{
	BOOST_REQUIRE_EQUAL(hh::alpha_m(-40.0), 1.0);
	BOOST_REQUIRE_CLOSE(hh::alpha_n(-55.0), 0.1, 1e-10);
}


BOOST_AUTO_TEST_CASE(alpha_m_continuous)
{
	BOOST_REQUIRE_CLOSE(hh::alpha_m(-40.0 + 1e-6), hh::alpha_m(-40.0), 1e-3);
	BOOST_REQUIRE_CLOSE(hh::alpha_m(-40.0 - 1e-6), hh::alpha_m(-40.0), 1e-3);
	BOOST_REQUIRE_CLOSE(hh::alpha_m(-40.0 + 1e-9), hh::alpha_m(-40.0), 1e-3);
}


BOOST_AUTO_TEST_CASE(phi_limit)
{
	BOOST_REQUIRE_EQUAL(phi(0.0), 1.0);
	BOOST_REQUIRE_CLOSE(phi(-1.0), 1.0 - std::exp(-1.0), 1e-10);
	BOOST_REQUIRE_CLOSE(phi(1e-9), 1.0, 1e-6);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(integrator)

BOOST_AUTO_TEST_CASE(invalid_timestep)
{
	BOOST_REQUIRE_THROW(Integrator(1, NEURITE_EULER, 0.0, stationary), numerical_error);
	BOOST_REQUIRE_THROW(Integrator(1, NEURITE_EULER, -0.1, stationary), numerical_error);
}


BOOST_AUTO_TEST_CASE(invalid_dimension)
{
	BOOST_REQUIRE_THROW(Integrator(0, NEURITE_EULER, 0.1, stationary), configuration_error);
	BOOST_REQUIRE_THROW(Integrator(Integrator::MAX_DIMENSION + 1, NEURITE_EULER, 0.1, stationary),
			configuration_error);
	BOOST_REQUIRE_THROW(Integrator(1, 42, 0.1, stationary), configuration_error);
}


BOOST_AUTO_TEST_CASE(euler_step)
{
	Integrator integrator(1, NEURITE_EULER, 0.5, constantSlope);
	double y = 1.0;
	double aux = 2.0;
	double out;
	integrator.step(0.0, &y, &aux, &out);
	BOOST_REQUIRE_CLOSE(out, 2.0, 1e-10);
}


/* For a purely linear system exponential-Euler is the exact solution,
 * regardless of the step size */
BOOST_AUTO_TEST_CASE(exponential_euler_exact)
{
	const double tau = 2.0;
	const double dt = 0.1;
	Integrator integrator(1, NEURITE_EXPONENTIAL_EULER, dt,
			boost::bind(linearDecay, tau, _1, _2, _3, _4, _5));
	double y = 1.0;
	for(unsigned s=0; s < 100; ++s) {
		double next;
		integrator.step(s * dt, &y, NULL, &next);
		y = next;
	}
	BOOST_REQUIRE_CLOSE(y, std::exp(-100 * dt / tau), 1e-8);
}


BOOST_AUTO_TEST_CASE(non_finite)
{
	Integrator integrator(1, NEURITE_EULER, 0.1, notANumber);
	double y = 0.0;
	double out;
	BOOST_REQUIRE_THROW(integrator.step(0.0, &y, NULL, &out), numerical_error);
}


BOOST_AUTO_TEST_CASE(noise)
{
	Integrator integrator(1, NEURITE_EULER, 0.1, stationary);
	integrator.setNoise(std::vector<double>(1, 1.0));
	BOOST_REQUIRE(integrator.hasNoise());

	std::vector<RNG> rng1(1), rng2(1);
	initialiseRng(7, rng1);
	initialiseRng(7, rng2);

	double y = 0.0;
	double out1, out2;
	integrator.step(0.0, &y, NULL, &out1, &rng1[0]);
	integrator.step(0.0, &y, NULL, &out2, &rng2[0]);
	BOOST_REQUIRE_EQUAL(out1, out2);
	BOOST_REQUIRE(out1 != 0.0);

	/* missing generator is a programming error */
	BOOST_REQUIRE_THROW(integrator.step(0.0, &y, NULL, &out1), neurite::exception);

	integrator.setNoise(std::vector<double>(1, 0.0));
	BOOST_REQUIRE(!integrator.hasNoise());
	BOOST_REQUIRE_THROW(integrator.setNoise(std::vector<double>(2, 1.0)), configuration_error);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(state_vector)

static const char* const FIELDS[] = { "V", "m", "input" };

BOOST_AUTO_TEST_CASE(fields)
{
	StateVector state(FIELDS, 3, 4);
	BOOST_REQUIRE_EQUAL(state.size(), 4U);
	BOOST_REQUIRE_EQUAL(state.fieldCount(), 3U);
	BOOST_REQUIRE_EQUAL(state.fieldIndex("m"), 1U);
	BOOST_REQUIRE(state.hasField("input"));
	BOOST_REQUIRE(!state.hasField("spike"));
	BOOST_REQUIRE_EQUAL(state.fieldName(2), "input");
	BOOST_REQUIRE_THROW(state.fieldIndex("spike"), configuration_error);
	BOOST_REQUIRE_THROW(state.get(3, 0), configuration_error);
}


BOOST_AUTO_TEST_CASE(values)
{
	StateVector state(FIELDS, 3, 4);
	for(unsigned f=0; f < 3; ++f) {
		for(size_t n=0; n < 4; ++n) {
			BOOST_REQUIRE_EQUAL(state.get(f, n), 0.0);
		}
	}

	state.set("m", 2, 0.5);
	BOOST_REQUIRE_EQUAL(state[1][2], 0.5);
	BOOST_REQUIRE_EQUAL(state.get("m", 2), 0.5);

	state.fill(0, -65.0);
	BOOST_REQUIRE_EQUAL(state.get("V", 3), -65.0);
	BOOST_REQUIRE_EQUAL(state.get("m", 2), 0.5);

	BOOST_REQUIRE_THROW(state.set(0, 4, 1.0), neurite::exception);
}


BOOST_AUTO_TEST_CASE(invalid_layout)
{
	const char* const repeated[] = { "V", "V" };
	BOOST_REQUIRE_THROW(StateVector(repeated, 2, 1), configuration_error);
	const char* const empty[] = { "V", "" };
	BOOST_REQUIRE_THROW(StateVector(empty, 2, 1), configuration_error);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(parameters)

static const char* const NAMES[] = { "tau", "delay", "weight" };
static const double DEFAULTS[] = { 8.0, 0.0, 0.1 };

BOOST_AUTO_TEST_CASE(defaults)
{
	Parameters params("Test", NAMES, DEFAULTS, 3, Parameters::overrides_t());
	BOOST_REQUIRE_EQUAL(params.size(), 3U);
	BOOST_REQUIRE_EQUAL(params[0], 8.0);
	BOOST_REQUIRE_EQUAL(params.get("weight"), 0.1);
	BOOST_REQUIRE_EQUAL(params.name(1), "delay");
	BOOST_REQUIRE_THROW(params.get("g_max"), configuration_error);
}


BOOST_AUTO_TEST_CASE(overrides)
{
	Parameters params("Test", NAMES, DEFAULTS, 3, override("tau", 2.0));
	BOOST_REQUIRE_EQUAL(params[0], 2.0);
	BOOST_REQUIRE_EQUAL(params[2], 0.1);
	BOOST_REQUIRE_THROW(Parameters("Test", NAMES, DEFAULTS, 3, override("g_max", 1.0)),
			configuration_error);
	BOOST_REQUIRE_THROW(Parameters("Test", NAMES, DEFAULTS, 3,
				override("tau", std::numeric_limits<double>::infinity())),
			configuration_error);
}


BOOST_AUTO_TEST_CASE(validation)
{
	Parameters params("Test", NAMES, DEFAULTS, 3, override("tau", -1.0));
	BOOST_REQUIRE_THROW(params.requirePositive(0), configuration_error);
	BOOST_REQUIRE_THROW(params.requireNonNegative(0), configuration_error);
	BOOST_REQUIRE_NO_THROW(params.requireNonNegative(1));
	BOOST_REQUIRE_THROW(params.requirePositive(1), configuration_error);
}


BOOST_AUTO_TEST_CASE(load)
{
	std::string filename = writeTempFile(
			"[Test]\n"
			"tau = 4.5\n"
			"weight = 2\n"
			"[Other]\n"
			"tau = 100\n");
	Parameters::overrides_t overrides = Parameters::load(filename, "Test");
	boost::filesystem::remove(filename);

	BOOST_REQUIRE_EQUAL(overrides.size(), 2U);
	BOOST_REQUIRE_EQUAL(overrides["tau"], 4.5);
	BOOST_REQUIRE_EQUAL(overrides["weight"], 2.0);

	Parameters params("Test", NAMES, DEFAULTS, 3, overrides);
	BOOST_REQUIRE_EQUAL(params[0], 4.5);
}


BOOST_AUTO_TEST_CASE(load_invalid)
{
	BOOST_REQUIRE_THROW(Parameters::load("/nonexistent/params.ini", "Test"), configuration_error);

	std::string filename = writeTempFile("[Test]\ntau = fast\n");
	BOOST_REQUIRE_THROW(Parameters::load(filename, "Test"), configuration_error);
	boost::filesystem::remove(filename);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(config)

BOOST_AUTO_TEST_CASE(defaults)
{
	Configuration conf;
	BOOST_REQUIRE_EQUAL(conf.timestep(), 0.1);
	BOOST_REQUIRE_EQUAL(conf.seed(), 0U);
	BOOST_REQUIRE(!conf.loggingEnabled());
	BOOST_REQUIRE_EQUAL(conf.progressPeriod(), 0.0);

	std::ostringstream out;
	out << conf;
	BOOST_REQUIRE(!out.str().empty());
}


BOOST_AUTO_TEST_CASE(invalid_timestep)
{
	Configuration conf;
	BOOST_REQUIRE_THROW(conf.setTimestep(0.0), configuration_error);
	BOOST_REQUIRE_THROW(conf.setTimestep(-0.01), configuration_error);
	BOOST_REQUIRE_THROW(conf.setTimestep(std::numeric_limits<double>::quiet_NaN()), configuration_error);
	BOOST_REQUIRE_THROW(conf.setProgressPeriod(-1.0), configuration_error);
	BOOST_REQUIRE_EQUAL(conf.timestep(), 0.1);
}


BOOST_AUTO_TEST_CASE(load)
{
	std::string filename = writeTempFile(
			"timestep = 0.025\n"
			"seed = 17\n"
			"logging = false\n"
			"progress = 10\n");
	Configuration conf(filename);
	boost::filesystem::remove(filename);

	BOOST_REQUIRE_EQUAL(conf.timestep(), 0.025);
	BOOST_REQUIRE_EQUAL(conf.seed(), 17U);
	BOOST_REQUIRE(!conf.loggingEnabled());
	BOOST_REQUIRE_EQUAL(conf.progressPeriod(), 10.0);
}


BOOST_AUTO_TEST_CASE(load_invalid)
{
	BOOST_REQUIRE_THROW(Configuration("/nonexistent/neurite.ini"), configuration_error);

	std::string filename = writeTempFile("timestep = -1\n");
	BOOST_REQUIRE_THROW(Configuration conf(filename), configuration_error);
	boost::filesystem::remove(filename);

	filename = writeTempFile("dt = 0.1\n");
	BOOST_REQUIRE_THROW(Configuration conf(filename), configuration_error);
	boost::filesystem::remove(filename);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(delay_line)

BOOST_AUTO_TEST_CASE(capacity)
{
	BOOST_REQUIRE_EQUAL(DelayLine(0.0, 0.1).capacity(), 1U);
	BOOST_REQUIRE_EQUAL(DelayLine(1.0, 0.1).delaySteps(), 10U);
	BOOST_REQUIRE_EQUAL(DelayLine(0.3, 0.1).delaySteps(), 3U);
	BOOST_REQUIRE_EQUAL(DelayLine(0.25, 0.1).delaySteps(), 3U);
	BOOST_REQUIRE_EQUAL(DelayLine(0.3, 0.1).capacity(), 4U);
}


BOOST_AUTO_TEST_CASE(underrun)
{
	BOOST_REQUIRE_THROW(DelayLine(-0.1, 0.1), delay_line_underrun);
	BOOST_REQUIRE_THROW(DelayLine(std::numeric_limits<double>::quiet_NaN(), 0.1), delay_line_underrun);
	BOOST_REQUIRE_THROW(DelayLine(1.0, 0.0), delay_line_underrun);
	BOOST_REQUIRE_THROW(DelayLine(1.0, -0.1), delay_line_underrun);
}


/* A value pushed at step k comes out at step k+D and at no other step */
BOOST_AUTO_TEST_CASE(round_trip)
{
	DelayLine line(0.3, 0.1);
	const unsigned D = line.delaySteps();
	const unsigned k = 2;

	for(unsigned s=0; s < 20; ++s) {
		line.push(s == k ? 5.0 : 0.0);
		if(s == k + D) {
			BOOST_REQUIRE_EQUAL(line.pull(), 5.0);
		} else {
			BOOST_REQUIRE_EQUAL(line.pull(), 0.0);
		}
		line.advance();
	}
}


/* Slots are cleared once due, so a value is not repeated one cycle later
 * even if nothing new is pushed */
BOOST_AUTO_TEST_CASE(single_delivery)
{
	DelayLine line(0.2, 0.1);
	for(unsigned s=0; s < 10; ++s) {
		if(s == 0) {
			line.push(1.0);
		}
		BOOST_REQUIRE_EQUAL(line.pull(), s == 2 ? 1.0 : 0.0);
		line.advance();
	}
}


BOOST_AUTO_TEST_CASE(immediate)
{
	DelayLine line(0.0, 0.1);
	for(unsigned s=0; s < 5; ++s) {
		line.push(double(s));
		BOOST_REQUIRE_EQUAL(line.pull(), double(s));
		line.advance();
	}
	BOOST_REQUIRE_EQUAL(line.step(), 5U);
}


BOOST_AUTO_TEST_CASE(channels)
{
	DelayLine line(0.1, 0.1, 3);
	BOOST_REQUIRE_EQUAL(line.width(), 3U);

	const double in[3] = { 1.0, 2.0, 3.0 };
	line.push(in);
	BOOST_REQUIRE_EQUAL(line.pull(1), 0.0);
	line.advance();

	const double zero[3] = { 0.0, 0.0, 0.0 };
	line.push(zero);
	const double* out = line.pullAll();
	for(unsigned c=0; c < 3; ++c) {
		BOOST_REQUIRE_EQUAL(out[c], in[c]);
	}
	BOOST_REQUIRE_THROW(line.pull(3), neurite::exception);
	BOOST_REQUIRE_THROW(line.push(1.0), neurite::exception);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(connection_map)

BOOST_AUTO_TEST_CASE(sorted_by_source)
{
	std::vector<ConnectionMap::edge_t> edges;
	edges.push_back(std::make_pair(2U, 0U));
	edges.push_back(std::make_pair(0U, 1U));
	edges.push_back(std::make_pair(2U, 1U));
	edges.push_back(std::make_pair(0U, 0U));

	ConnectionMap map(3, 2, edges);
	BOOST_REQUIRE_EQUAL(map.size(), 4U);
	BOOST_REQUIRE_EQUAL(map.preSize(), 3U);
	BOOST_REQUIRE_EQUAL(map.postSize(), 2U);
	BOOST_REQUIRE(!map.weighted());

	BOOST_REQUIRE_EQUAL(map.begin(0), 0U);
	BOOST_REQUIRE_EQUAL(map.end(0), 2U);
	BOOST_REQUIRE_EQUAL(map.post(0), 1U);
	BOOST_REQUIRE_EQUAL(map.post(1), 0U);

	BOOST_REQUIRE_EQUAL(map.begin(1), map.end(1));

	BOOST_REQUIRE_EQUAL(map.begin(2), 2U);
	BOOST_REQUIRE_EQUAL(map.end(2), 4U);
	BOOST_REQUIRE_EQUAL(map.pre(2), 2U);
	BOOST_REQUIRE_EQUAL(map.post(2), 0U);
	BOOST_REQUIRE_EQUAL(map.post(3), 1U);
	BOOST_REQUIRE_EQUAL(map.weight(3), 1.0);
}


BOOST_AUTO_TEST_CASE(weights)
{
	std::vector<ConnectionMap::edge_t> edges;
	edges.push_back(std::make_pair(1U, 0U));
	edges.push_back(std::make_pair(0U, 0U));
	std::vector<double> weights;
	weights.push_back(0.5);
	weights.push_back(-1.5);

	ConnectionMap map(2, 1, edges, weights);
	BOOST_REQUIRE(map.weighted());
	BOOST_REQUIRE_EQUAL(map.weight(0), -1.5);
	BOOST_REQUIRE_EQUAL(map.weight(1), 0.5);

	weights.pop_back();
	BOOST_REQUIRE_THROW(ConnectionMap(2, 1, edges, weights), configuration_error);
}


BOOST_AUTO_TEST_CASE(invalid_ids)
{
	std::vector<ConnectionMap::edge_t> edges(1, std::make_pair(3U, 0U));
	BOOST_REQUIRE_THROW(ConnectionMap(3, 3, edges), configuration_error);
	edges[0] = std::make_pair(0U, 3U);
	BOOST_REQUIRE_THROW(ConnectionMap(3, 3, edges), configuration_error);
}


BOOST_AUTO_TEST_CASE(connectors)
{
	ConnectionMap all = ConnectionMap::allToAll(3, 3, false);
	BOOST_REQUIRE_EQUAL(all.size(), 6U);
	for(sidx_t e=0; e < all.size(); ++e) {
		BOOST_REQUIRE(all.pre(e) != all.post(e));
	}
	BOOST_REQUIRE_EQUAL(ConnectionMap::allToAll(2, 3).size(), 6U);

	ConnectionMap one = ConnectionMap::oneToOne(4);
	BOOST_REQUIRE_EQUAL(one.size(), 4U);
	for(nidx_t n=0; n < 4; ++n) {
		BOOST_REQUIRE_EQUAL(one.end(n) - one.begin(n), 1U);
		BOOST_REQUIRE_EQUAL(one.post(one.begin(n)), n);
	}

	std::vector< std::vector<bool> > matrix(2, std::vector<bool>(3, false));
	matrix[0][2] = true;
	matrix[1][0] = true;
	matrix[1][1] = true;
	ConnectionMap dense = ConnectionMap::fromMatrix(matrix);
	BOOST_REQUIRE_EQUAL(dense.size(), 3U);
	BOOST_REQUIRE_EQUAL(dense.postSize(), 3U);
	BOOST_REQUIRE_EQUAL(dense.post(0), 2U);
	BOOST_REQUIRE_EQUAL(dense.begin(1), 1U);

	matrix[1].pop_back();
	BOOST_REQUIRE_THROW(ConnectionMap::fromMatrix(matrix), configuration_error);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE(stimulus)

BOOST_AUTO_TEST_CASE(constant_current)
{
	std::vector<segment_t> segments;
	segments.push_back(segment_t(5.0, 0.5));
	segments.push_back(segment_t(0.0, 0.2));
	segments.push_back(segment_t(-1.0, 0.3));

	std::vector<double> currents = constantCurrent(segments, 0.1);
	BOOST_REQUIRE_EQUAL(currents.size(), 10U);
	BOOST_REQUIRE_EQUAL(currents[0], 5.0);
	BOOST_REQUIRE_EQUAL(currents[4], 5.0);
	BOOST_REQUIRE_EQUAL(currents[5], 0.0);
	BOOST_REQUIRE_EQUAL(currents[7], -1.0);
	BOOST_REQUIRE_EQUAL(currents[9], -1.0);
}


BOOST_AUTO_TEST_CASE(invalid)
{
	std::vector<segment_t> segments(1, segment_t(1.0, -1.0));
	BOOST_REQUIRE_THROW(constantCurrent(segments, 0.1), configuration_error);
	segments[0] = segment_t(1.0, 1.0);
	BOOST_REQUIRE_THROW(constantCurrent(segments, 0.0), configuration_error);
}

BOOST_AUTO_TEST_SUITE_END()



namespace neurite {
	namespace test {
		namespace network {

/* One LIF unit driving another through a voltage jump synapse */
struct Pair
{
	Pair(double delay = 0.0) :
		conf(configuration(0.01)),
		net(conf),
		pre(new LIF(conf, 1)),
		post(new LIF(conf, 1))
	{
		net.addNeurons(pre);
		net.addNeurons(post);
		net.addSynapses(synapses_ptr(new VoltageJump(conf, *pre, *post,
						ConnectionMap::oneToOne(1), override("delay", delay))));
	}

	Configuration conf;
	Network net;
	neurons_ptr pre;
	neurons_ptr post;
};


/* Input strong enough to take a LIF unit from rest past threshold in a single
 * step of 0.01ms */
const double KICK = 1e5;


/* Synapses are updated before neurons, so a spike reaches its target no
 * earlier than the following step */
void
stepOrder()
{
	Pair p;
	Network::current_stimulus istim(1, std::make_pair(0U, KICK));
	p.net.step(*p.pre, istim);
	BOOST_REQUIRE_EQUAL(p.pre->fired().size(), 1U);
	BOOST_REQUIRE_EQUAL(p.post->potential()[0], 0.0);

	p.net.step();
	BOOST_REQUIRE(p.pre->fired().empty());
	BOOST_REQUIRE(p.post->potential()[0] > 0.99);
	BOOST_REQUIRE(p.post->potential()[0] < 1.0);
}


void
delayedDelivery()
{
	/* 0.05ms is five steps */
	Pair p(0.05);
	Network::current_stimulus istim(1, std::make_pair(0U, KICK));
	p.net.step(*p.pre, istim);

	/* the spike is taken in by the synapse at step 1 and arrives at step 6 */
	for(unsigned s=1; s < 6; ++s) {
		p.net.step();
		BOOST_REQUIRE_EQUAL(p.post->potential()[0], 0.0);
	}
	p.net.step();
	BOOST_REQUIRE(p.post->potential()[0] > 0.99);
}


void
failure()
{
	Configuration conf = configuration(0.01);
	Network net(conf);
	neurons_ptr hh(new HodgkinHuxley(conf, 2));
	net.addNeurons(hh);
	net.step();

	Network::current_stimulus istim(1,
			std::make_pair(1U, std::numeric_limits<double>::quiet_NaN()));
	BOOST_REQUIRE_THROW(net.step(*hh, istim), numerical_error);
	BOOST_REQUIRE(net.failed());
	BOOST_REQUIRE_THROW(net.step(), neurite::exception);
	BOOST_REQUIRE_EQUAL(net.steps(), 1U);
}


void
invalidStimulus()
{
	Configuration conf = configuration(0.01);
	Network net(conf);
	neurons_ptr lif(new LIF(conf, 2));
	net.addNeurons(lif);

	Network::current_stimulus istim;
	istim.push_back(std::make_pair(0U, KICK));
	istim.push_back(std::make_pair(2U, 1.0));
	BOOST_REQUIRE_THROW(net.step(*lif, istim), neurite::exception);

	/* nothing applied */
	BOOST_REQUIRE_EQUAL(lif->input()[0], 0.0);
	BOOST_REQUIRE(!net.failed());

	LIF other(conf, 2);
	BOOST_REQUIRE_THROW(net.step(other, Network::current_stimulus()), neurite::exception);
}


void
construction()
{
	Configuration conf = configuration(0.01);
	Network net(conf);
	neurons_ptr a(new LIF(conf, 2));
	neurons_ptr b(new LIF(conf, 2));
	net.addNeurons(a);
	BOOST_REQUIRE_THROW(net.addNeurons(a), configuration_error);

	/* b is not part of the network */
	synapses_ptr syn(new Exponential(conf, *a, *b, ConnectionMap::oneToOne(2)));
	BOOST_REQUIRE_THROW(net.addSynapses(syn), configuration_error);
	net.addNeurons(b);
	BOOST_REQUIRE_NO_THROW(net.addSynapses(syn));
	BOOST_REQUIRE_EQUAL(net.neuronGroupCount(), 2U);
	BOOST_REQUIRE_EQUAL(net.synapseGroupCount(), 1U);

	neurons_ptr coarse(new LIF(configuration(0.1), 1));
	BOOST_REQUIRE_THROW(net.addNeurons(coarse), configuration_error);
}


void
run()
{
	Configuration conf = configuration(0.1);
	Network net(conf);
	net.addNeurons(neurons_ptr(new Izhikevich(conf, 3)));
	net.run(1.0);
	BOOST_REQUIRE_EQUAL(net.steps(), 10U);
	BOOST_REQUIRE_CLOSE(net.time(), 1.0, 1e-10);
	BOOST_REQUIRE_THROW(net.run(-1.0), neurite::exception);

	BOOST_REQUIRE_EQUAL(net.stepCount(0.26), 3U);
	BOOST_REQUIRE_EQUAL(net.stepCount(0.0), 0U);
	BOOST_REQUIRE_THROW(net.stepCount(-5.0), neurite::exception);
	BOOST_REQUIRE_THROW(net.stepCount(std::numeric_limits<double>::infinity()), neurite::exception);
	BOOST_REQUIRE_EQUAL(net.steps(), 10U);
}


/* With constant input exponential-Euler integrates the LIF membrane exactly,
 * so the potential follows R I (1 - exp(-t/tau)) while the input lasts */
void
schedule()
{
	const double dt = 0.1;
	Configuration conf = configuration(dt);
	Network net(conf);
	neurons_ptr lif(new LIF(conf, 2));
	net.addNeurons(lif);

	std::vector<segment_t> segments;
	segments.push_back(segment_t(5.0, 0.5));
	segments.push_back(segment_t(0.0, 0.5));
	net.addCurrentSchedule(*lif, constantCurrent(segments, dt));

	std::vector<std::string> fields(1, "V");
	boost::shared_ptr<Monitor> monitor(new Monitor(lif->state(), fields));
	net.addMonitor(monitor);

	net.run(0.5);
	const double V5 = 5.0 * (1.0 - std::exp(-0.5 / 10.0));
	BOOST_REQUIRE_CLOSE(lif->potential()[0], V5, 1e-6);
	BOOST_REQUIRE_CLOSE(lif->potential()[1], V5, 1e-6);

	net.run(0.5);
	BOOST_REQUIRE_CLOSE(lif->potential()[0], V5 * std::exp(-0.5 / 10.0), 1e-6);

	BOOST_REQUIRE_EQUAL(monitor->length(), 10U);
	BOOST_REQUIRE_EQUAL(monitor->times()[0], 0.0);
	std::vector<double> trace = monitor->trace("V", 1);
	BOOST_REQUIRE_EQUAL(trace.size(), 10U);
	BOOST_REQUIRE_CLOSE(trace[4], V5, 1e-6);
	BOOST_REQUIRE(trace[9] < trace[4]);

	neurons_ptr other(new LIF(conf, 1));
	BOOST_REQUIRE_THROW(net.addCurrentSchedule(*other, std::vector<double>(1, 1.0)), configuration_error);
}


void
monitor()
{
	Configuration conf = configuration(0.01);
	HodgkinHuxley hh(conf, 2);

	std::vector<std::string> fields;
	fields.push_back("V");
	fields.push_back("m");
	Monitor monitor(hh.state(), fields);

	monitor.record(0.0);
	hh.update(0.0);
	monitor.record(0.01);

	BOOST_REQUIRE_EQUAL(monitor.length(), 2U);
	BOOST_REQUIRE_EQUAL(monitor.trace("V", 0)[0], -65.0);
	BOOST_REQUIRE_EQUAL(monitor.trace("m", 1)[1], hh.state().get("m", 1));
	BOOST_REQUIRE_THROW(monitor.trace("h", 0), configuration_error);
	BOOST_REQUIRE_THROW(monitor.trace("V", 2), neurite::exception);

	std::ostringstream out;
	monitor.write(out);
	std::istringstream in(out.str());
	std::string header;
	std::getline(in, header);
	BOOST_REQUIRE_EQUAL(header, "t V[0] V[1] m[0] m[1]");
	double t, V0;
	in >> t >> V0;
	BOOST_REQUIRE_EQUAL(t, 0.0);
	BOOST_REQUIRE_EQUAL(V0, -65.0);

	fields.push_back("w");
	BOOST_REQUIRE_THROW(Monitor(hh.state(), fields), configuration_error);
}


BOOST_AUTO_TEST_SUITE(network)
	BOOST_AUTO_TEST_CASE(step_order) { stepOrder(); }
	BOOST_AUTO_TEST_CASE(delayed_delivery) { delayedDelivery(); }
	BOOST_AUTO_TEST_CASE(failed_network_stops) { failure(); }
	BOOST_AUTO_TEST_CASE(invalid_stimulus) { invalidStimulus(); }
	BOOST_AUTO_TEST_CASE(group_ownership) { construction(); }
	BOOST_AUTO_TEST_CASE(run_duration) { run(); }
	BOOST_AUTO_TEST_CASE(current_schedule) { schedule(); }
	BOOST_AUTO_TEST_CASE(monitor_recording) { monitor(); }
BOOST_AUTO_TEST_SUITE_END()

		}
	}
}


#include "HodgkinHuxley.cpp"
#include "Izhikevich.cpp"
#include "HindmarshRose.cpp"
#include "LIF.cpp"
#include "synapses.cpp"

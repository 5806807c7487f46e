#ifndef BURST_SPEEDUP_MODEL_HPP
#define BURST_SPEEDUP_MODEL_HPP

/* Copyright 2010 Imperial College London
 *
 * This file is part of burst.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with burst. If not, see <http://www.gnu.org/licenses/>.
 */

namespace burst {

/*! \brief Constants of the throughput model used to estimate GPU speedup
 *
 * The estimate compares the time to compute one burst on the CPU against
 * the time to transfer the per-burst data and compute it on the device. */
struct SpeedupModel
{
	SpeedupModel() :
		cpuGflops(100.0),
		wgpuTflops(10.0),
		wgpuBandwidthGBs(25.0),
		wgpuOverheadUs(200.0),
		cudaTflops(19.5),
		cudaBandwidthGBs(32.0),
		cudaOverheadUs(100.0),
		opsPerSynapse(10.0),
		opsPerNeuron(20.0),
		minSpeedup(0.1),
		maxSpeedup(100.0),
		requiredSpeedup(1.5) {}

	double cpuGflops;

	double wgpuTflops;
	double wgpuBandwidthGBs;
	double wgpuOverheadUs;    // fixed per-burst dispatch and sync cost

	double cudaTflops;
	double cudaBandwidthGBs;
	double cudaOverheadUs;

	double opsPerSynapse;
	double opsPerNeuron;

	/* Reported speedups are clamped to this range */
	double minSpeedup;
	double maxSpeedup;

	/* A GPU which reaches its size threshold is only chosen automatically
	 * when its estimate exceeds this */
	double requiredSpeedup;
};

}

#endif

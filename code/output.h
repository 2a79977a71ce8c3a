/*
 * output.h
 *
 * This contains all functions for writing the dispatch results,
 * failure diagnoses and run information to the disk.
 *
 */

#ifndef __OUTPUT_H
#define __OUTPUT_H

#include <filesystem>
#include <ostream>
#include <string>

#include "dispatch_logic.h"
#include "result_extraction.h"

namespace output {

    /**
     * This function initializes the output directory (Global::get_output_path()),
     * stores it in global::current_output_dir and writes the file build_and_run_info.txt
     * as well as parameter-settings-general.txt.
     * It has to be called once before any result is written.
     *
     * @return false, if the directory cannot be created
     */
    bool initializeDirectories();

    /**
     * Returns the file name for a scenario specific output file,
     * e.g. 0007-dispatch.csv for scenario_id = 7 and suffix = "dispatch.csv"
     */
    std::string scenarioFileName(unsigned long scenario_id, const char* suffix);

    //
    // Writers for the individual tables. They can be used with any stream.
    //
    void writeDispatchTable(std::ostream& out, const DispatchResult& result);     ///< One row per time step, net bus injection of every device and carrier plus mode flows and indicators
    void writeSOCTable(std::ostream& out, const DispatchResult& result);          ///< One row per SOC point (T+1 rows), one column per storage unit
    void writeBusBalanceTable(std::ostream& out, const DispatchResult& result);   ///< Supply, consumption, demand and residual per bus and time step
    void writeOperatingStatesTable(std::ostream& out, const DispatchResult& result);
    void writeSummary(std::ostream& out, const std::string& scenario_name, const DispatchResult& result);
    void writeFailure(std::ostream& out, const std::string& scenario_name, const dispatch::SolveFailure& failure);

    /**
     * Writes all result files of one scenario into global::current_output_dir.
     */
    void outputDispatchResult(unsigned long scenario_id, const std::string& scenario_name, const DispatchResult& result);

    /**
     * Writes the failure diagnosis of one scenario into global::current_output_dir.
     */
    void outputDispatchFailure(unsigned long scenario_id, const std::string& scenario_name, const dispatch::SolveFailure& failure);

    /**
     * Output information on the run time to the file build_and_run_info.txt.
     * Thus function must not be called before initializeDirectories().
     *
     * @param seconds_setup: The duration of the setup and data loading in seconds
     * @param seconds_main_run: The duration of all solves in seconds
     */
    void outputRuntimeInformation(long seconds_setup, long seconds_main_run);

    /**
     * Prints all device types of the catalog with their parameters, defaults and valid ranges.
     */
    void printDeviceCatalog(std::ostream& out);

}

#endif

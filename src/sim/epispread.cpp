/*************************************************************************
 *  ./src/sim/epispread.cpp
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

#include <iostream>
#include <cstdlib>
#include <string>
#include <sstream>
#include <memory>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "Simulation.hpp"
#include "Configuration.hpp"
#include "Data.hpp"
#include "TimeseriesWriter.hpp"
#include "Random.hpp"

using namespace EpiSpread;

#define MAX_DT 0.1

struct Settings
{
  std::string output;
  std::string import;
  std::string format;

  double duration;
  double dt;
  unsigned long seed;

  Configuration parameters;

  Settings() :
    format("csv"), duration(60.0), dt(1.0 / 60.0), seed(0)
  {
  }

  void
  load(const std::string& filename)
  {
    using boost::property_tree::ptree;
    ptree pt;

    read_xml(filename, pt);

    parameters.load(pt, "epispread.parameters");

    output = pt.get<std::string> ("epispread.paths.output", output);
    import = pt.get<std::string> ("epispread.paths.import", import);

    duration = pt.get<double> ("epispread.options.duration", duration);
    dt = pt.get<double> ("epispread.options.dt", dt);
    seed = pt.get<unsigned long> ("epispread.options.seed", seed);
    format = pt.get<std::string> ("epispread.options.format", format);
  }

};

namespace
{
  bool
  endsWith(const std::string& s, const std::string& suffix)
  {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  void
  importFile(const std::string& filename, Timeseries& timeseries)
  {
    std::shared_ptr<DataImporter<Sample> > importer;
    if (endsWith(filename, ".json"))
      importer.reset(new JsonTimeseriesImporter(filename));
    else
      importer.reset(new CsvTimeseriesImporter(filename));

    importAll(*importer, timeseries);
  }

  void
  exportTimeseries(const Timeseries& timeseries, const std::string& filename,
      const std::string& format)
  {
    if (filename.empty())
      {
        std::cout.precision(15);
        if (format == "json")
          writeJson(std::cout, timeseries);
        else
          writeCsv(std::cout, timeseries);
        return;
      }

    std::shared_ptr<TimeseriesWriter> writer;
    if (format == "json")
      writer.reset(new JsonTimeseriesWriter(filename));
    else
      writer.reset(new CsvTimeseriesWriter(filename));

    writer->open();
    writer->write(timeseries);
    writer->close();
  }
}

int
main(int argc, char* argv[])
{
  // Runs the agent simulation and writes its timeseries

  Settings settings;
  std::string preset;
  bool verbose = false;
  bool dump = false;

  try
    {
      po::options_description desc("Allowed options");
      desc.add_options()
          ("help,h", "Show help message")
          ("config,c", po::value<std::string>(), "config file to use")
          ("seed,s", po::value<unsigned long>(), "random seed (default 0)")
          ("preset,p", po::value<std::string>(), "parameter preset: default, fast, vaccination or low")
          ("duration,d", po::value<double>(), "simulated seconds to run (default 60)")
          ("dt", po::value<double>(), "simulated seconds per step, at most 0.1")
          ("output,o", po::value<std::string>(), "timeseries output file (default stdout)")
          ("format,f", po::value<std::string>(), "output format, csv or json")
          ("import,i", po::value<std::string>(), "import a .csv or .json timeseries instead of simulating")
          ("verbose,v", "print each sample as it is taken")
          ("dump", "print the final population to stderr");

      po::variables_map vm;
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);

      if (vm.count("help"))
        {
          std::cout << desc << "\n";
          return EXIT_FAILURE;
        }

      if (vm.count("config"))
        settings.load(vm["config"].as<std::string> ());

      if (vm.count("seed")) settings.seed = vm["seed"].as<unsigned long> ();
      if (vm.count("preset")) preset = vm["preset"].as<std::string> ();
      if (vm.count("duration")) settings.duration = vm["duration"].as<double> ();
      if (vm.count("dt")) settings.dt = vm["dt"].as<double> ();
      if (vm.count("output")) settings.output = vm["output"].as<std::string> ();
      if (vm.count("format")) settings.format = vm["format"].as<std::string> ();
      if (vm.count("import")) settings.import = vm["import"].as<std::string> ();
      verbose = vm.count("verbose") > 0;
      dump = vm.count("dump") > 0;

      if (settings.format != "csv" && settings.format != "json")
        {
          std::cerr << "Unknown output format '" << settings.format << "'" << "\n";
          std::cerr << desc << "\n";
          return EXIT_FAILURE;
        }
    }
  catch (std::exception& e)
    {
      std::cerr << "Exception: " << e.what() << "\n";
      return 2;
    }

  Random random(settings.seed);
  Simulation simulation(random);

  try
    {
      if (!settings.import.empty())
        {
          Timeseries imported;
          importFile(settings.import, imported);
          simulation.importTimeseries(imported);
          std::cerr << "Imported " << simulation.getTimeseries().size()
              << " records, simulated time " << simulation.getTime() << "\n";
        }
      else
        {
          if (!preset.empty())
            applyPreset(settings.parameters, preset);
          simulation.init(settings.parameters);

          simTime_t dt = settings.dt;
          if (!(dt > 0.0) || dt > MAX_DT) dt = MAX_DT;

          size_t reported = 0;
          while (simulation.getTime() < settings.duration)
            {
              simulation.step(dt);
              if (verbose && simulation.getTimeseries().size() > reported)
                {
                  const Sample& s = simulation.getTimeseries().back();
                  std::cerr << "t=" << s.t
                      << "\tH=" << s.healthy
                      << "\tI=" << s.infected
                      << "\tA=" << s.asymptomatic
                      << "\tR=" << s.recovered
                      << "\tV=" << s.vaccinated << std::endl;
                  reported = simulation.getTimeseries().size();
                }
            }

          if (dump) simulation.dumpPopulation(std::cerr);
        }

      exportTimeseries(simulation.getTimeseries(), settings.output,
          settings.format);
    }
  catch (configuration_error& e)
    {
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  catch (std::exception& e)
    {
      std::cerr << "Exception: " << e.what() << std::endl;
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}

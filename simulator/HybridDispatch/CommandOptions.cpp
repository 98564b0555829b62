/*==============================================================================
Options

This implements the options class, i.e. the constructor implementing the
parsing of the command line options and the configuration file.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <string>                    // Standard strings
#include <iostream>                  // Printing help
#include <fstream>                   // Configuration file
#include <sstream>                   // Error messages
#include <stdexcept>                 // Standard exceptions
#include <cstdlib>                   // Exit codes
#include <boost/program_options.hpp> // Option parser
#include <boost/numeric/conversion/cast.hpp> // Casting numeric types

#include "CommandOptions.hpp"

namespace cmd = boost::program_options;

HybridDispatch::CommandLineOptions::CommandLineOptions( int argc,
                                                        const char * const argv[] )
: WorkingDirectory( std::filesystem::current_path() ),
  PriceProfile(), ProductionProfile(), ConsumptionProfile(),
  Results("Results.csv"), Battery(), Dispatch(), Finance()
{
  // Values that are converted after parsing

  std::string ShapeName;
  long        TimeLimit = 0;

  // The options class must have an object describing the options and the
  // help messages generated. The files are only accepted on the command line
  // or in the configuration file, and the parameters can be given in both.

  cmd::options_description Files("Files");

  Files.add_options()
    ( "help,h",  "Produce this help message" )
    ( "Configuration,f", cmd::value< std::string >(),
                 "Configuration file with parameter values" )
    ( "Prices,p", cmd::value< std::string >()->required(),
                 "File name of the price time series" )
    ( "Production,s", cmd::value< std::string >()->required(),
                 "File name of the solar production time series" )
    ( "Consumption,c", cmd::value< std::string >()->required(),
                 "File name of the consumption time series" )
    ( "Directory,d", cmd::value< std::string >(),
                 "Working directory" )
    ( "Results,r", cmd::value< std::string >(),
                 "Result file name" );

  cmd::options_description BatteryOptions("Battery");

  BatteryOptions.add_options()
    ( "battery_capacity", cmd::value< double >( &Battery.Capacity )->required(),
      "Energy capacity of the battery" )
    ( "battery_power_limit",
      cmd::value< double >( &Battery.PowerLimit )->required(),
      "Energy that can be charged or discharged in one time step" )
    ( "charge_efficiency",
      cmd::value< double >( &Battery.ChargeEfficiency )->required(),
      "Charging efficiency in (0,1]" )
    ( "discharge_efficiency",
      cmd::value< double >( &Battery.DischargeEfficiency )->required(),
      "Discharging efficiency in (0,1]" )
    ( "soc_min", cmd::value< double >( &Battery.SOCMin )->required(),
      "Lowest state of charge" )
    ( "soc_max", cmd::value< double >( &Battery.SOCMax )->required(),
      "Highest state of charge" )
    ( "soc_initial", cmd::value< double >( &Battery.SOCInitial )->required(),
      "State of charge at the start of the simulation" );

  cmd::options_description DispatchOptions("Dispatch");

  DispatchOptions.add_options()
    ( "soc_full_epsilon",
      cmd::value< double >( &Dispatch.FullTolerance )->default_value( 1e-4 ),
      "Tolerance for considering the battery full" )
    ( "excess_threshold",
      cmd::value< double >( &Dispatch.ExcessThreshold )->default_value( 1e-6 ),
      "Minimum excess production starting a charging opportunity" )
    ( "end_soc_target", cmd::value< double >(),
      "Soft target for the state of charge at the end of a cycle. "
      "Default: soc_min" )
    ( "end_soc_penalty_rate",
      cmd::value< double >( &Dispatch.EndSOCPenalty )->default_value( 2000.0 ),
      "Cost per energy unit stored above the end target" )
    ( "charge_early_bonus_rate",
      cmd::value< double >( &Dispatch.ChargeBonusRate )->default_value( 0.01 ),
      "Bonus per energy unit charged early in a cycle" )
    ( "charge_early_shape",
      cmd::value< std::string >( &ShapeName )->default_value( "linear" ),
      "Weighting of the early charge bonus: linear or uniform" )
    ( "max_extension_steps",
      cmd::value< unsigned int >( &Dispatch.MaxExtensions )->default_value( 10 ),
      "Maximal number of times a cycle window can be extended" )
    ( "constraint_tolerance",
      cmd::value< double >( &Dispatch.ConstraintTolerance )
        ->default_value( 1e-9 ),
      "Tolerance of the solver on the state of charge constraints" )
    ( "solver_time_limit",
      cmd::value< long >( &TimeLimit )->default_value( 10 ),
      "Time limit in seconds for solving one window" )
    ( "solver_max_evaluations",
      cmd::value< int >( &Dispatch.SolverMaxEvaluations )
        ->default_value( 2000 ),
      "Maximal number of solver evaluations for one window" );

  cmd::options_description FinanceOptions("Finance");

  FinanceOptions.add_options()
    ( "pv_mw", cmd::value< double >( &Finance.PVPower )->default_value( 1.0 ),
      "Installed PV power" )
    ( "pv_reference_mw",
      cmd::value< double >( &Finance.PVReferencePower )->default_value( 1.0 ),
      "PV power of the production time series" )
    ( "capex_pv",
      cmd::value< double >( &Finance.PVInvestment )->default_value( 0.0 ),
      "PV investment per kWp" )
    ( "capex_battery",
      cmd::value< double >( &Finance.BatteryInvestment )->default_value( 0.0 ),
      "Battery investment per kWh" )
    ( "pv_lifetime",
      cmd::value< unsigned int >( &Finance.PVLifetime )->default_value( 25 ),
      "Lifetime of the PV installation in years" )
    ( "discount_rate",
      cmd::value< double >( &Finance.DiscountRate )->default_value( 0.0 ),
      "Yearly discount rate as a fraction" )
    ( "guaranteed_cycles",
      cmd::value< unsigned int >( &Finance.GuaranteedCycles )
        ->default_value( 6000 ),
      "Number of full cycles guaranteed by the battery manufacturer" )
    ( "roundtrip_efficiency",
      cmd::value< double >( &Finance.RoundTripEfficiency )
        ->default_value( 0.0 ),
      "Battery round trip efficiency. Default: the product of the efficiencies" );

  cmd::options_description Description("Allowed options");
  Description.add( Files ).add( BatteryOptions ).add( DispatchOptions )
             .add( FinanceOptions );

  // The values are stored in a map from option names to values. The first
  // value stored for an option is kept, and the command line must therefore
  // be stored before the configuration file.

  cmd::variables_map Values;

  cmd::store( cmd::parse_command_line( argc, argv, Description), Values );

  // Printing the description of the options if the help option is present

  if ( Values.count("help") > 0 )
  {
    std::cout << Description << std::endl;
    exit( EXIT_SUCCESS );
  }

  if ( Values.count("Configuration") > 0 )
  {
    std::filesystem::path
    ConfigurationFile( Values["Configuration"].as< std::string >() );

    std::ifstream ConfigurationStream( ConfigurationFile );

    if ( !ConfigurationStream )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The configuration file " << ConfigurationFile
                   << " could not be opened";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    cmd::store( cmd::parse_config_file( ConfigurationStream, Description ),
                Values );
  }

  // Throwing an exception if the required options are not given, and
  // setting the bound parameter variables.

  cmd::notify( Values );

  PriceProfile       = Values["Prices"].as< std::string >();
  ProductionProfile  = Values["Production"].as< std::string >();
  ConsumptionProfile = Values["Consumption"].as< std::string >();

  if ( Values.count("Results") > 0 )
    Results = Values["Results"].as< std::string >();

  if ( Values.count("Directory") > 0 )
  {
    WorkingDirectory = Values["Directory"].as< std::string >();

    if ( !std::filesystem::is_directory( WorkingDirectory ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The given working directory " << WorkingDirectory
                   << " is not a directory";

      throw std::invalid_argument( ErrorMessage.str() );
    }
  }

  if ( Values.count("end_soc_target") > 0 )
    Dispatch.EndSOCTarget = Values["end_soc_target"].as< double >();

  Dispatch.ChargeShape     = ParseChargeWeighting( ShapeName );
  Dispatch.SolverTimeLimit = std::chrono::seconds(
    boost::numeric_cast< std::chrono::seconds::rep >( TimeLimit ) );

  ValidateParameters( Battery, Dispatch );
  ValidateParameters( Finance );

  // Verifying that the input files exist

  for ( const std::filesystem::path & FileToCheck :
        { PriceFile(), ProductionFile(), ConsumptionFile() } )
    if ( !std::filesystem::exists( FileToCheck ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The input file " << FileToCheck << " does not exist";

      throw std::invalid_argument( ErrorMessage.str() );
    }
}

#include <mollusk/harness/config.hpp>
#include <mollusk/harness/exceptions.hpp>

#include <mollusk/runtime/exceptions.hpp>

#include <yaml-cpp/yaml.h>

namespace mollusk {

namespace {

template< typename T >
T get_option( const std::string& key, const T& default_value, const YAML::Node& config )
{
   if ( config && config[ key ] )
      return config[ key ].as< T >();

   return default_value;
}

harness_config apply_config( const YAML::Node& config )
{
   harness_config cfg;

   if ( config.IsNull() )
      return cfg;

   MOLLUSK_ASSERT( config.IsMap(), config_exception, "config must be a map" );

   // clang-format off
   cfg.log_level                                   = get_option< std::string >( LOG_LEVEL_OPTION, LOG_LEVEL_DEFAULT, config );
   cfg.log_color                                   = get_option< bool >( LOG_COLOR_OPTION, LOG_COLOR_DEFAULT, config );
   cfg.compute_budget.compute_unit_limit           = get_option< uint64_t >( COMPUTE_UNIT_LIMIT_OPTION, cfg.compute_budget.compute_unit_limit, config );
   cfg.compute_budget.max_instruction_stack_depth  = get_option< uint64_t >( MAX_INSTRUCTION_STACK_DEPTH_OPTION, cfg.compute_budget.max_instruction_stack_depth, config );
   cfg.compute_budget.max_instruction_trace_length = get_option< uint64_t >( MAX_INSTRUCTION_TRACE_LENGTH_OPTION, cfg.compute_budget.max_instruction_trace_length, config );
   cfg.fee_structure.lamports_per_signature        = get_option< uint64_t >( LAMPORTS_PER_SIGNATURE_OPTION, cfg.fee_structure.lamports_per_signature, config );
   // clang-format on

   if ( config[ SLOT_OPTION ] )
      cfg.slot = config[ SLOT_OPTION ].as< uint64_t >();

   auto log_dir = get_option< std::string >( LOG_DIR_OPTION, std::string(), config );
   if ( !log_dir.empty() )
      cfg.log_dir = std::filesystem::path( log_dir );

   if ( config[ FEATURES_OPTION ] )
   {
      cfg.feature_set = runtime::feature_set();

      for ( const auto& name : config[ FEATURES_OPTION ].as< std::vector< std::string > >() )
      {
         try
         {
            cfg.feature_set.activate( name );
         }
         catch ( const runtime::unknown_feature_exception& e )
         {
            MOLLUSK_THROW( config_exception, "invalid ${k}: ${e}", ("k", FEATURES_OPTION)("e", e.get_message()) );
         }
      }
   }

   for ( const auto& p : get_option< std::vector< std::string > >( PROGRAM_PATH_OPTION, {}, config ) )
      cfg.program_paths.emplace_back( p );

   return cfg;
}

} // anonymous

harness_config load_config( const std::filesystem::path& path )
{
   try
   {
      return apply_config( YAML::LoadFile( path.string() ) );
   }
   catch ( const YAML::Exception& e )
   {
      MOLLUSK_THROW( config_exception, "unable to load config ${p}: ${e}", ("p", path.string())("e", e.what()) );
   }
}

harness_config parse_config( const std::string& yaml )
{
   try
   {
      return apply_config( YAML::Load( yaml ) );
   }
   catch ( const YAML::Exception& e )
   {
      MOLLUSK_THROW( config_exception, "unable to parse config: ${e}", ("e", e.what()) );
   }
}

} // mollusk

#include "ipld.hh"

namespace {

  constexpr int EXIT_NO_VALUE = 2;
  constexpr int EXIT_USAGE = 64;

  void print_usage( std::ostream& os ) {
    os << "usage: ipld [--max-depth N] <command>\n"
      << "  links       list every merkle-link as <path>\\t<cid>\n"
      << "  get PATH    print the value at PATH\n"
      << "  tokens      print the ordered token stream\n"
      << "The document (YAML or JSON) is read from standard input.\n";
  }

  std::string describe_payload( const ipld::TokenPayload& payload ) {
    if ( const auto* key = std::get_if< std::string >( &payload ) ) {
      return *key;
    }
    if ( const auto* idx = std::get_if< std::size_t >( &payload ) ) {
      return std::to_string( *idx );
    }
    if ( const auto* v = std::get_if< const ipld::Value* >( &payload ) ) {
      std::string s = ipld::ordered_node::serialize( ipld::to_yaml( **v ) );
      while ( !s.empty() && s.back() == '\n' ) s.pop_back();
      return s;
    }
    return std::string();
  }

  int run_links( const ipld::Node& doc, std::size_t max_depth ) {
    // std::map keeps the output sorted by path
    for ( const auto& [path, link] : ipld::links( doc, max_depth ) ) {
      std::cout << path << '\t' << link.link_string() << '\n';
    }
    return 0;
  }

  int run_get( const ipld::Node& doc, const std::string& path ) {
    const std::optional< ipld::Value > v = ipld::get( doc, path );
    if ( !v ) {
      std::cerr << "[ipld] no value at '" << path << "'\n";
      return EXIT_NO_VALUE;
    }
    std::cout << ipld::ordered_node::serialize( ipld::to_yaml( *v ) );
    return 0;
  }

  int run_tokens( const ipld::Node& doc ) {
    ipld::read( doc, []( const ipld::Path& path, ipld::TokenKind kind,
      const ipld::TokenPayload& payload )
    {
      std::cout << '/' << ipld::path_to_string( path ) << ' '
        << ipld::token_name( kind );
      const std::string text = describe_payload( payload );
      if ( !text.empty() ) std::cout << ' ' << text;
      std::cout << '\n';
      return ipld::Control::Continue;
    } );
    return 0;
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    std::vector< std::string > args( argv + 1, argv + argc );
    std::size_t max_depth = ipld::DEFAULT_MAX_DEPTH;

    std::size_t pos = 0;
    while ( pos < args.size() && args[ pos ].rfind( "--", 0 ) == 0 ) {
      if ( args[ pos ] == "--max-depth" && pos + 1 < args.size() ) {
        const auto parsed = ipld::internal::parse_index( args[ pos + 1 ] );
        if ( !parsed || *parsed == 0 ) {
          std::cerr << "[ipld] --max-depth expects a positive integer\n";
          return EXIT_USAGE;
        }
        max_depth = *parsed;
        pos += 2;
      }
      else if ( args[ pos ] == "--help" ) {
        print_usage( std::cout );
        return 0;
      }
      else {
        std::cerr << "[ipld] unknown option '" << args[ pos ] << "'\n";
        print_usage( std::cerr );
        return EXIT_USAGE;
      }
    }

    if ( pos >= args.size() ) {
      print_usage( std::cerr );
      return EXIT_USAGE;
    }

    const std::string command = args[ pos++ ];
    const bool wants_path = ( command == "get" );
    if ( ( command != "links" && command != "get" && command != "tokens" )
      || ( wants_path && pos + 1 != args.size() )
      || ( !wants_path && pos != args.size() ) )
    {
      print_usage( std::cerr );
      return EXIT_USAGE;
    }

    const ipld::Node doc = ipld::parse_document( std::cin, max_depth );

    if ( command == "links" ) return run_links( doc, max_depth );
    if ( command == "get" ) return run_get( doc, args[ pos ] );
    return run_tokens( doc );
  } catch ( const std::exception& ex ) {
    std::cerr << "[ipld] error: " << ex.what() << "\n";
    return 1;
  }
}

#include "config_file.hh"
#include "rdt_client.hh"
#include "socket.hh"
#include "stream_channel.hh"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <span>
#include <sstream>

using namespace std;

void show_usage( const char* argv0 )
{
  cerr << "Usage: " << argv0 << " [-c CONFIG] [HOST [PORT]]\n\n"
       << "  -c names the configuration file (default client_config.txt).\n"
       << "  HOST and PORT default to localhost 12345." << endl;
}

int main( int argc, char** argv )
{
  try {
    if ( argc <= 0 ) {
      abort(); // For sticklers: don't try to access argv[0] if argc <= 0.
    }

    auto args = span( argv, argc );

    string config_path = "client_config.txt";
    string host = "localhost";
    string port = "12345";

    size_t next = 1;
    if ( args.size() > 2 and strcmp( args[1], "-c" ) == 0 ) {
      config_path = args[2];
      next = 3;
    }
    if ( args.size() > next + 2 or ( args.size() > 1 and args[1][0] == '-' and next == 1 ) ) {
      show_usage( args[0] );
      return EXIT_FAILURE;
    }
    if ( args.size() > next ) {
      host = args[next];
    }
    if ( args.size() > next + 1 ) {
      port = args[next + 1];
    }

    // a vanished peer should surface as an EPIPE error, not kill the process
    signal( SIGPIPE, SIG_IGN );

    auto cfg = load_config_file( config_path );
    if ( not cfg.has_value() ) {
      cout << "Config file " << config_path << " not found. Using manual input:\n";
      cfg = prompt_config( Role::Client, cin, cout );
    }

    ifstream message_file { cfg->message_path };
    if ( not message_file.is_open() ) {
      cerr << "Error: Message file '" << cfg->message_path << "' not found." << endl;
      return EXIT_FAILURE;
    }
    stringstream contents;
    contents << message_file.rdbuf();
    cfg->source_data = contents.str();

    TCPSocket socket;
    socket.connect( { host, port } );

    StreamChannel channel { move( socket ) };
    RDTClient client { cfg.value(), channel, cout };
    const TransferSummary result = client.run();

    cout << "Sent " << result.segments << " segment(s), " << result.timeouts << " timeout(s)." << endl;
    if ( not result.fin_acknowledged ) {
      return EXIT_FAILURE;
    }
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

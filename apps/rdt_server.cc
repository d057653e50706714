#include "config_file.hh"
#include "rdt_server.hh"
#include "socket.hh"
#include "stream_channel.hh"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <span>

using namespace std;

void show_usage( const char* argv0 )
{
  cerr << "Usage: " << argv0 << " [-c CONFIG] [HOST [PORT]]\n\n"
       << "  -c names the configuration file (default server_config.txt).\n"
       << "  HOST:PORT is the listening address (default localhost 12345)." << endl;
}

// Serve one accepted connection; a failed session is reported and the server moves on
void serve( TCPSocket&& connection, const string& config_path )
{
  optional<RDTConfig> cfg;
  try {
    cfg = load_config_file( config_path );
    if ( not cfg.has_value() ) {
      cout << "Config file " << config_path << " not found. Using manual input:\n";
      cfg = prompt_config( Role::Server, cin, cout );
    }
  } catch ( const exception& e ) {
    cerr << "Config error: " << e.what() << endl;
    return;
  }

  StreamChannel channel { move( connection ) };
  const bool finished = serve_connection(
    channel,
    cfg.value(),
    []( string_view message ) {
      cout << "\n--- FINAL MESSAGE ---\n" << message << "\n--------------------\n" << endl;
    },
    cout,
    cerr );
  if ( not finished ) {
    cout << "Session ended without a complete transfer." << endl;
  }
}

int main( int argc, char** argv )
{
  try {
    if ( argc <= 0 ) {
      abort(); // For sticklers: don't try to access argv[0] if argc <= 0.
    }

    auto args = span( argv, argc );

    string config_path = "server_config.txt";
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

    signal( SIGPIPE, SIG_IGN );

    TCPSocket listening_socket;                // create a TCP socket
    listening_socket.set_reuseaddr();          // reuse the server's address as soon as the program quits
    listening_socket.bind( { host, port } );   // bind to specified address
    listening_socket.listen( 1 );              // one session at a time
    cout << "The server is ready to receive on " << listening_socket.local_address().to_string() << endl;

    while ( true ) {
      TCPSocket connection = listening_socket.accept();
      cout << "New connection from " << connection.peer_address().to_string() << endl;
      serve( move( connection ), config_path );
    }
  } catch ( const exception& e ) {
    cerr << "Exception: " << e.what() << endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

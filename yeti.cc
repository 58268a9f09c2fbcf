#include "yeti_fkyaml.hh"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

  // Indentation is read once from the environment, before anything is
  // encoded: YETI_SPACER is the indent unit, YETI_SPACER_WIDTH how many
  // units make up one nesting level
  yeti::IndentConfig config_from_environment() {
    yeti::IndentConfig config;
    if ( const char* spacer = std::getenv("YETI_SPACER") ) {
      config.unit = spacer;
    }
    if ( const char* width = std::getenv("YETI_SPACER_WIDTH") ) {
      std::istringstream iss( width );
      int w = 0;
      if ( !(iss >> w) || !iss.eof() ) {
        throw std::runtime_error( "YETI_SPACER_WIDTH must be an integer"
          " (got '" + std::string(width) + "')" );
      }
      config.width = w;
    }
    return config;
  }

} // namespace

int main() {
  try {
    const yeti::Encoder encoder( yeti::Indenter(config_from_environment()) );
    yeti::Value tree = yeti::from_yaml( std::cin );
    std::cout << encoder.encode( tree );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[yeti] error: " << ex.what() << "\n";
    return 1;
  }
}

#include <libxml/parser.h>

#include "application.hpp"

int main(int argc, char** argv) {
    xmlInitParser();
    int result = application::instance().run(argc, argv);
    xmlCleanupParser();
    return result;
}

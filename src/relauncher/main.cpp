#include "relauncher/relauncher.hpp"

int main(int argc, char* argv[]) {
    return Relauncher::main(argc, argv);
}

#include "Ds9SampDriver.hpp"

int main(int argc, char** argv) {
  return ds9samp::driverMain(ds9samp::DriverKind::LIST, argc, argv);
}

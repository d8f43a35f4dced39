#include <stdio.h>
#include <stdlib.h>
#include <sys/types.h>
#include <unistd.h>

// Forks a child that sleeps for argv[1] seconds, prints the pid of the child
// and sleeps as well. The child keeps stdout open.
int main(int argc, char** argv) {
  useconds_t duration = static_cast<useconds_t>(atof(argv[1]) * 1000000);
  pid_t pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) {
    usleep(duration);
    return 0;
  }
  printf("%d\n", static_cast<int>(pid));
  fflush(stdout);
  usleep(duration);
  return 0;
}

#ifndef INCLUDE_ARBITER_LOGGER_H_
#define INCLUDE_ARBITER_LOGGER_H_

// Hold the console sink locks across fork() so that children spawned
// while another thread is logging never inherit a locked sink.
void InitLogger();

#endif  // INCLUDE_ARBITER_LOGGER_H_

#ifndef INCLUDE_TRAINER_LOGGER_H_
#define INCLUDE_TRAINER_LOGGER_H_

// Keep console sinks usable in children forked by Execute
void InitLogger();

#endif  // INCLUDE_TRAINER_LOGGER_H_

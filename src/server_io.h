#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <arbiter/queue.h>
#include <arbiter/judging.h>

// These functions will push the request into queue and return immediately
void SendJobProgress(const JobInfo&); // coalesced per job
void SendJobCompleted(const JobInfo&);
void SendJobFailed(const JobInfo&, const std::string& error);
void SendJudgingStatus(const std::string& match_id, const JudgingStatusReport&);
void SendQueueStats(const QueueStats&);

// This function will initialize websocket connection and deal with all server interactions.
// It will not return.
void ServerWorkLoop(QueueManager& queue, Judge& judge);

#endif  // SERVER_IO_H_

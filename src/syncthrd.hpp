/*

Blink

*/

#ifndef __SYNCTHRD_HPP__
#define __SYNCTHRD_HPP__

#ifdef BLINK_UNIX

// ---- Operating System Thread ----

typedef pthread_t OSThreadHandle;

// ---- Operating System Exclusive ----

typedef pthread_mutex_t OSExclusive;

void InitializeExclusive(OSExclusive * ose);

inline void EnterExclusive(OSExclusive * ose)
{
    pthread_mutex_lock(ose);
}

inline void LeaveExclusive(OSExclusive * ose)
{
    pthread_mutex_unlock(ose);
}

inline int TryExclusive(OSExclusive * ose)
{
    return(pthread_mutex_trylock(ose) == 0);
}

inline void DeleteExclusive(OSExclusive * ose)
{
    pthread_mutex_destroy(ose);
}

// ---- Operating System Condition ----

typedef pthread_cond_t OSCondition;

inline void InitializeCondition(OSCondition * osc)
{
    pthread_cond_init(osc, 0);
}

inline void ConditionWait(OSCondition * osc, OSExclusive * ose)
{
    pthread_cond_wait(osc, ose);
}

inline void WakeCondition(OSCondition * osc)
{
    pthread_cond_signal(osc);
}

inline void WakeAllCondition(OSCondition * osc)
{
    pthread_cond_broadcast(osc);
}

inline void DeleteCondition(OSCondition * osc)
{
    pthread_cond_destroy(osc);
}

#endif // BLINK_UNIX

int ConditionWaitTimeout(OSCondition * osc, OSExclusive * ose, ulong_t us);
void SleepMicroseconds(ulong_t us);

typedef void * (*OSThreadFn)(void * arg);
int StartThread(OSThreadHandle * h, OSThreadFn fn, void * arg);
void JoinThread(OSThreadHandle h);

// ---- Oneshot Channels ----
//
// A single value travels from one sender to one receiver. Either side may be
// dropped first; the oneshot is freed when both are gone.

typedef struct
{
    OSExclusive Exclusive;
    ulong_t References;
    int Sent;
    int ReceiverDropped;
    int Failed;
    BValue Value;
} BOneshot;

BOneshot * MakeOneshot();
int OneshotSend(BOneshot * os, BValue val, int failed);
int OneshotTryReceive(BOneshot * os, BValue * pv, int * failed);
void OneshotDropSender(BOneshot * os);
void OneshotDropReceiver(BOneshot * os);

// ----------------

class BWithExclusive
{
public:

    BWithExclusive(OSExclusive * ose);
    ~BWithExclusive();

private:

    OSExclusive * Exclusive;
};

#endif // __SYNCTHRD_HPP__

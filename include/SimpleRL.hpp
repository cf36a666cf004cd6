#pragma once

#include"Blob.hpp"
#include"Define.hpp"
#include"Errors.hpp"

#include"Space/ArrayContinuousSpace.hpp"
#include"Space/ArrayDiscreteSpace.hpp"
#include"Space/BoxSpace.hpp"
#include"Space/ContinuousSpace.hpp"
#include"Space/DiscreteSpace.hpp"
#include"Space/Space.hpp"

#include"Env/EnvBase.hpp"
#include"Env/EnvConfig.hpp"
#include"Env/EnvRegistry.hpp"
#include"Env/EnvRun.hpp"
#include"Envs/Grid.hpp"
#include"Envs/Othello.hpp"

#include"Worker/ExtendWorker.hpp"
#include"Worker/Processor.hpp"
#include"Worker/RuleBaseWorker.hpp"
#include"Worker/SpaceAdapter.hpp"
#include"Worker/WorkerAdapter.hpp"
#include"Worker/WorkerBase.hpp"
#include"Worker/WorkerRun.hpp"

#include"RL/AlgorithmFactory.hpp"
#include"RL/RLConfig.hpp"
#include"RL/RLParameter.hpp"
#include"RL/RLRegistry.hpp"
#include"RL/RLRemoteMemory.hpp"
#include"RL/RLSpaces.hpp"
#include"RL/RLTrainer.hpp"
#include"RL/RLWorker.hpp"

#include"Algorithms/DQN.hpp"
#include"Algorithms/QL.hpp"

#include"Runner/Episode.hpp"

#include"Transport/InProcessChannel.hpp"
#include"Transport/Transport.hpp"
#include"Transport/ZmqTransport.hpp"

#include"Distributed/Actor.hpp"
#include"Distributed/Learner.hpp"
#include"Distributed/ParameterMailbox.hpp"

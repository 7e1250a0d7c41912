// Ticket: 0009_experiment_world

#ifndef CUT_SIM_KINEMATICS_ROBOT_LAYOUT_HPP
#define CUT_SIM_KINEMATICS_ROBOT_LAYOUT_HPP

#include <string>
#include <vector>

namespace cut_sim
{

/**
 * @brief Names binding controllers, guard and task logic to a model
 *
 * Everything bound to a segment looks joints and bodies up by these names on
 * the live model, so the bindings survive topology changes that renumber
 * bodies.
 */
struct RobotLayout
{
  std::vector<std::string> armJoints{"iiwa_joint_1",
                                     "iiwa_joint_2",
                                     "iiwa_joint_3",
                                     "iiwa_joint_4",
                                     "iiwa_joint_5",
                                     "iiwa_joint_6",
                                     "iiwa_joint_7"};
  std::string leftFingerJoint{"left_finger_sliding_joint"};
  std::string rightFingerJoint{"right_finger_sliding_joint"};
  std::string knifeJoint{"knife_joint"};
  std::string bladeBody{"knife"};
  std::string endEffectorFrame{"iiwa_frame_ee"};
};

}  // namespace cut_sim

#endif  // CUT_SIM_KINEMATICS_ROBOT_LAYOUT_HPP
